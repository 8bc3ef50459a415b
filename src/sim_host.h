#pragma once

#include "aircraft_state.h"

#include <chrono>
#include <cstdint>
#include <string>

namespace panelbridge {

struct SimNotification {
    enum class Kind { Open, Quit, Data, Unknown };
    Kind kind = Kind::Unknown;
    TelemetrySample sample;  // Data only
    std::string detail;      // Unknown only
};

enum class PollStatus { Notification, None, Error };

// Narrow interface to the simulation host. Every call comes from the
// simulation link thread. Failing calls return false (or PollStatus::Error)
// and describe the problem in `err`.
class SimHost {
public:
    virtual ~SimHost() = default;

    virtual bool connect(const std::string& clientName, std::string& err) = 0;
    virtual void disconnect() = 0;

    virtual bool subscribeAircraftState(std::string& err) = 0;
    virtual bool mapEvent(uint32_t eventId, const std::string& hostEventName, std::string& err) = 0;
    virtual bool transmitEvent(uint32_t eventId, uint32_t data, std::string& err) = 0;

    // Waits at most `timeout` for the next notification.
    virtual PollStatus nextNotification(SimNotification& out, std::chrono::milliseconds timeout, std::string& err) = 0;
};

}  // namespace panelbridge
