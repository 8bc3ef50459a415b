#pragma once

#include "event_router.h"
#include "sim_host.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace panelbridge {

enum class SimLinkState { Disconnected, Connecting, Connected };

const char* simLinkStateToString(SimLinkState state);

struct SimLinkConfig {
    std::string clientName = "PanelBridge";
    std::chrono::milliseconds reconnectDelay{5000};
    std::chrono::milliseconds pollTimeout{10};
};

// Keeps a connection to the simulation host alive, forwarding panel commands
// to it and broadcasting aircraft state to every attached panel. Host
// failures are never fatal: run() reconnects after a backoff until
// requestStop().
class SimLink {
public:
    SimLink(SimLinkConfig config, SimHost& host, SimEndpoints endpoints);
    SimLink(const SimLink&) = delete;
    SimLink& operator=(const SimLink&) = delete;

    void run();
    void requestStop();

    SimLinkState state() const { return state_.load(); }
    bool registered() const { return connected_.load(); }
    std::size_t panelCount() const { return panelCount_.load(); }
    uint64_t connectAttempts() const { return connectAttempts_.load(); }

private:
    enum class SessionEnd { Quit, Error, Stopped };

    bool stopRequested() const { return stop_.load(); }
    SessionEnd runSession(std::string& err);
    bool registerWithHost(std::string& err);
    bool forwardCommand(std::string& err);
    void acceptNewPanels();
    void broadcast(const AircraftState& state);
    void waitBackoff();
    void setState(SimLinkState state);

    SimLinkConfig config_;
    SimHost& host_;
    SimEndpoints endpoints_;
    std::vector<StateTarget> targets_;
    bool commandsClosed_ = false;
    // Last state broadcast in this session; replayed to panels that attach later.
    std::optional<AircraftState> lastState_;

    std::atomic<bool> stop_{false};
    std::atomic<bool> connected_{false};
    std::atomic<SimLinkState> state_{SimLinkState::Disconnected};
    std::atomic<std::size_t> panelCount_{0};
    std::atomic<uint64_t> connectAttempts_{0};

    std::mutex waitMutex_;
    std::condition_variable waitCv_;
};

}  // namespace panelbridge
