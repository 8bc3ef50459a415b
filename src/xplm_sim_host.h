#pragma once

#include "sim_host.h"

#include "XPLMDataAccess.h"
#include "XPLMUtilities.h"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace panelbridge {

// SimHost backed by the X-Plane SDK. XPLM may only be used from the
// simulator's main thread, so the simulation link's calls are queued and
// executed by pump(), which the flight loop callback runs every frame.
class XplmSimHost : public SimHost {
public:
    XplmSimHost() = default;
    XplmSimHost(const XplmSimHost&) = delete;
    XplmSimHost& operator=(const XplmSimHost&) = delete;

    // Main thread.
    void setOnline(bool online, const std::string& reason);
    void pump();

    bool connect(const std::string& clientName, std::string& err) override;
    void disconnect() override;
    bool subscribeAircraftState(std::string& err) override;
    bool mapEvent(uint32_t eventId, const std::string& hostEventName, std::string& err) override;
    bool transmitEvent(uint32_t eventId, uint32_t data, std::string& err) override;
    PollStatus nextNotification(SimNotification& out, std::chrono::milliseconds timeout, std::string& err) override;

private:
    struct Request {
        enum class Kind { Subscribe, MapEvent };
        Kind kind = Kind::Subscribe;
        uint32_t eventId = 0;
        std::string name;
        bool done = false;
        bool ok = false;
        std::string err;
    };

    struct OutboundEvent {
        uint32_t eventId;
        uint32_t data;
    };

    struct Binding {
        enum class Type { Command, Dataref };
        Type type = Type::Command;
        std::string path;
        XPLMCommandRef cmd = nullptr;
        XPLMDataRef dataref = nullptr;
        int datarefType = 0;
    };

    bool submitAndWait(const std::shared_ptr<Request>& req, std::string& err);
    void postNotificationLocked(SimNotification notification);

    // Main thread only.
    void handleRequest(Request& req);
    void executeEvent(const OutboundEvent& ev);
    TelemetrySample readTelemetry() const;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool online_ = false;
    bool connected_ = false;
    bool openPending_ = false;
    uint64_t session_ = 0;
    std::string clientName_;
    std::deque<std::shared_ptr<Request>> requests_;
    std::deque<OutboundEvent> outbound_;
    std::deque<SimNotification> notifications_;
    std::unordered_set<uint32_t> mappedEvents_;

    uint64_t boundSession_ = 0;
    std::unordered_map<uint32_t, Binding> bindings_;
    bool subscribed_ = false;
    XPLMDataRef drGearDeploy_ = nullptr;
    XPLMDataRef drAirspeed_ = nullptr;
    XPLMDataRef drParkingBrake_ = nullptr;
    std::optional<TelemetrySample> lastSample_;
};

}  // namespace panelbridge
