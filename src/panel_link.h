#pragma once

#include "aircraft_state.h"
#include "event_router.h"
#include "serial_transport.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace panelbridge {

enum class PanelType { EventSim, Airspeed };

// Static per-device-class behavior.
struct PanelTraits {
    PanelType type;
    const char* name;
    int defaultBaud;
    bool bannerHandshake;  // identifies itself with a banner instead of SYN/ACK
    bool keepalive;
};

const PanelTraits& panelTraits(PanelType type);
const char* panelTypeToString(PanelType type);
bool parsePanelType(const std::string& val, PanelType& out);

struct PanelError {
    enum class Kind { SerialOpen, Disconnect, WrongDevice, Serial, Io };
    Kind kind = Kind::Io;
    std::string port;
    std::string cause;

    std::string describe() const;
};

enum class PanelLinkState { Disconnected, Opening, Handshaking, Connected };

const char* panelLinkStateToString(PanelLinkState state);

// True once `interval` or more has passed since the last line went out.
bool keepaliveDue(std::chrono::steady_clock::duration sinceLastLine, std::chrono::milliseconds interval);

struct PanelLinkConfig {
    std::string name;
    PanelType type = PanelType::EventSim;
    std::string port;
    SerialSettings serial;
    int resetDelayMs = 2000;
    int keepaliveMs = 500;
};

// Drives one panel over its serial transport. run() blocks until a fatal
// error (returned) or until requestStop() (returns nullopt).
class PanelLink {
public:
    PanelLink(PanelLinkConfig config, std::unique_ptr<SerialTransport> transport, PanelEndpoints endpoints);
    PanelLink(const PanelLink&) = delete;
    PanelLink& operator=(const PanelLink&) = delete;

    std::optional<PanelError> run();
    void requestStop();

    PanelLinkState state() const { return state_.load(); }
    const PanelLinkConfig& config() const { return config_; }

    // Individual phases of run(), usable on their own.
    std::optional<PanelError> open();
    std::optional<PanelError> handshake();
    std::optional<PanelError> serviceOnce();

private:
    bool stopRequested() const { return stop_.load(); }
    void setState(PanelLinkState state);
    void closeTransport();
    std::optional<PanelError> fail(PanelError::Kind kind, const std::string& cause);
    std::optional<PanelError> sendLine(const std::string& line);
    std::optional<PanelError> synAckHandshake();
    std::optional<PanelError> bannerHandshake();
    std::optional<PanelError> readInbound();
    std::optional<PanelError> pushState();
    std::optional<PanelError> keepalive();
    void forwardCommand(const std::string& token);
    void sleepInterruptible(std::chrono::milliseconds delay);

    PanelLinkConfig config_;
    const PanelTraits& traits_;
    std::unique_ptr<SerialTransport> transport_;
    PanelEndpoints endpoints_;

    std::atomic<bool> stop_{false};
    std::atomic<PanelLinkState> state_{PanelLinkState::Disconnected};
    std::optional<AircraftState> lastSent_;
    std::chrono::steady_clock::time_point lastLineSent_{};
    bool stateChannelClosed_ = false;
    bool commandChannelClosed_ = false;
};

}  // namespace panelbridge
