#pragma once

#include "event_router.h"
#include "panel_link.h"
#include "prefs.h"
#include "serial_transport.h"
#include "sim_host.h"
#include "sim_link.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace panelbridge {

using TransportFactory = std::function<std::unique_ptr<SerialTransport>(const PanelLinkConfig&)>;

struct PanelStatus {
    std::string name;
    PanelLinkState state = PanelLinkState::Disconnected;
    bool running = false;
    bool restartPending = false;
    int starts = 0;
    std::optional<PanelError> lastError;
};

// Owns the router, the simulation link thread and one thread per enabled
// panel. supervise() must be called periodically from a single thread; it
// reaps failed panels and restarts them when configured to.
class Bridge {
public:
    Bridge(Prefs prefs, SimHost& host, TransportFactory factory);
    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;
    ~Bridge();

    void start();
    void stop();
    void supervise();

    bool running() const { return running_; }
    std::vector<PanelStatus> panelStatus() const;
    const SimLink* simLink() const { return simLink_.get(); }

private:
    struct PanelWorker {
        PanelPrefs prefs;
        std::unique_ptr<PanelLink> link;
        std::thread thread;
        std::atomic<bool> finished{false};
        std::optional<PanelError> result;
        std::optional<PanelError> lastError;
        bool restartPending = false;
        std::chrono::steady_clock::time_point restartDue{};
        int starts = 0;
    };

    void launchPanel(PanelWorker& worker);
    void reapPanel(PanelWorker& worker);

    Prefs prefs_;
    SimHost& host_;
    TransportFactory factory_;
    bool running_ = false;

    std::unique_ptr<EventRouter> router_;
    std::unique_ptr<SimLink> simLink_;
    std::thread simThread_;
    std::vector<std::unique_ptr<PanelWorker>> panels_;
};

}  // namespace panelbridge
