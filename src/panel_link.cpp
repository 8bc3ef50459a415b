#include "panel_link.h"

#include "log.h"
#include "panel_protocol.h"
#include "plugin_utils.h"

#include <thread>
#include <vector>

namespace panelbridge {

namespace {

const PanelTraits kEventSimTraits{PanelType::EventSim, "EVENTSIM", 115200, false, true};
const PanelTraits kAirspeedTraits{PanelType::Airspeed, "AIRSPEED", 38400, true, false};

}  // namespace

const PanelTraits& panelTraits(PanelType type) {
    switch (type) {
        case PanelType::EventSim: return kEventSimTraits;
        case PanelType::Airspeed: return kAirspeedTraits;
    }
    return kEventSimTraits;
}

const char* panelTypeToString(PanelType type) {
    return panelTraits(type).name;
}

bool parsePanelType(const std::string& val, PanelType& out) {
    const std::string s = toUpper(trimString(val));
    if (s == "EVENTSIM" || s == "EVENT_SIM" || s == "EVENT-SIM") {
        out = PanelType::EventSim;
        return true;
    }
    if (s == "AIRSPEED" || s == "AIRSPEED_INDICATOR" || s == "AIRSPEED-INDICATOR") {
        out = PanelType::Airspeed;
        return true;
    }
    return false;
}

std::string PanelError::describe() const {
    switch (kind) {
        case Kind::SerialOpen:
            return "Failed to connect with panel on serial port '" + port + "': " + cause;
        case Kind::Disconnect:
            return "The panel on '" + port + "' disconnected";
        case Kind::WrongDevice:
            return "Unexpected device on '" + port + "'" + (cause.empty() ? "" : ": " + cause);
        case Kind::Serial:
            return "Serial communication error on '" + port + "': " + cause;
        case Kind::Io:
            return "Panel I/O error on '" + port + "': " + cause;
    }
    return "Panel error on '" + port + "'";
}

bool keepaliveDue(std::chrono::steady_clock::duration sinceLastLine, std::chrono::milliseconds interval) {
    return sinceLastLine >= interval;
}

const char* panelLinkStateToString(PanelLinkState state) {
    switch (state) {
        case PanelLinkState::Disconnected: return "disconnected";
        case PanelLinkState::Opening: return "opening";
        case PanelLinkState::Handshaking: return "handshaking";
        case PanelLinkState::Connected: return "connected";
    }
    return "unknown";
}

PanelLink::PanelLink(PanelLinkConfig config, std::unique_ptr<SerialTransport> transport, PanelEndpoints endpoints)
    : config_(std::move(config)),
      traits_(panelTraits(config_.type)),
      transport_(std::move(transport)),
      endpoints_(std::move(endpoints)) {}

std::optional<PanelError> PanelLink::run() {
    if (auto err = open()) {
        return err;
    }
    if (auto err = handshake()) {
        return err;
    }
    while (!stopRequested()) {
        if (auto err = serviceOnce()) {
            return err;
        }
    }
    closeTransport();
    setState(PanelLinkState::Disconnected);
    return std::nullopt;
}

void PanelLink::setState(PanelLinkState state) {
    PanelLinkState prev = state_.exchange(state);
    if (prev != state) {
        logDebug("Panel '" + config_.name + "': " + panelLinkStateToString(prev) + " -> " +
                 panelLinkStateToString(state));
    }
}

void PanelLink::closeTransport() {
    if (transport_->isOpen()) {
        transport_->close();
    }
}

void PanelLink::requestStop() {
    stop_.store(true);
}

std::optional<PanelError> PanelLink::fail(PanelError::Kind kind, const std::string& cause) {
    closeTransport();
    setState(PanelLinkState::Disconnected);
    PanelError err;
    err.kind = kind;
    err.port = config_.port;
    err.cause = cause;
    return err;
}

std::optional<PanelError> PanelLink::open() {
    setState(PanelLinkState::Opening);
    logDebug("Panel '" + config_.name + "': opening " + config_.port + " (" +
             serialSettingsSummary(config_.serial) + ")");
    std::string err;
    if (!transport_->open(config_.port, config_.serial, err)) {
        return fail(PanelError::Kind::SerialOpen, err);
    }
    // Asserting DTR resets the Arduino; give it time to boot.
    if (!transport_->setDataTerminalReady(true, err)) {
        return fail(PanelError::Kind::Serial, err);
    }
    if (!transport_->clearBuffers(err)) {
        return fail(PanelError::Kind::Serial, err);
    }
    sleepInterruptible(std::chrono::milliseconds(config_.resetDelayMs));
    return std::nullopt;
}

std::optional<PanelError> PanelLink::handshake() {
    setState(PanelLinkState::Handshaking);
    if (traits_.bannerHandshake) {
        return bannerHandshake();
    }
    return synAckHandshake();
}

std::optional<PanelError> PanelLink::synAckHandshake() {
    if (auto err = sendLine(kLineSyn)) {
        return err;
    }
    std::string line;
    std::string err;
    while (!stopRequested()) {
        switch (transport_->readLine(line, '\n', err)) {
            case ReadStatus::Timeout:
                continue;
            case ReadStatus::Error:
                return fail(PanelError::Kind::Io, err);
            case ReadStatus::Line:
                break;
        }
        if (line == kLineSynAck) {
            if (auto sendErr = sendLine(kLineAck)) {
                return sendErr;
            }
            setState(PanelLinkState::Connected);
            logLine("Connection with " + std::string(traits_.name) + " panel '" + config_.name +
                    "' established via " + config_.port);
            return std::nullopt;
        }
        if (line == kLineRst) {
            return fail(PanelError::Kind::Disconnect, "reset during handshake");
        }
        logDebug("Panel '" + config_.name + "': ignoring '" + line + "' while handshaking");
    }
    return std::nullopt;
}

std::optional<PanelError> PanelLink::bannerHandshake() {
    std::string line;
    std::string err;
    while (!stopRequested()) {
        switch (transport_->readLine(line, kAirspeedBannerTerminator, err)) {
            case ReadStatus::Timeout:
                continue;
            case ReadStatus::Error:
                return fail(PanelError::Kind::Io, err);
            case ReadStatus::Line:
                break;
        }
        const std::string banner = trimString(line);
        if (banner != kAirspeedBanner) {
            return fail(PanelError::Kind::WrongDevice, "got banner '" + banner + "'");
        }
        setState(PanelLinkState::Connected);
        lastLineSent_ = std::chrono::steady_clock::now();
        logLine("Connection with " + std::string(traits_.name) + " panel '" + config_.name +
                "' established via " + config_.port);
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<PanelError> PanelLink::serviceOnce() {
    if (auto err = readInbound()) {
        return err;
    }
    if (auto err = pushState()) {
        return err;
    }
    return keepalive();
}

std::optional<PanelError> PanelLink::sendLine(const std::string& line) {
    std::string err;
    if (!transport_->writeLine(line, err)) {
        return fail(PanelError::Kind::Io, err);
    }
    lastLineSent_ = std::chrono::steady_clock::now();
    return std::nullopt;
}

std::optional<PanelError> PanelLink::readInbound() {
    std::string line;
    std::string err;
    switch (transport_->readLine(line, '\n', err)) {
        case ReadStatus::Timeout:
            return std::nullopt;
        case ReadStatus::Error:
            return fail(PanelError::Kind::Io, err);
        case ReadStatus::Line:
            break;
    }
    if (line == kLineRst) {
        logLine("Panel '" + config_.name + "' requested reset");
        return fail(PanelError::Kind::Disconnect, "RST");
    }
    if (line == kLinePing) {
        return sendLine(kLinePong);
    }
    if (line == kLinePong) {
        return std::nullopt;
    }
    forwardCommand(line);
    return std::nullopt;
}

void PanelLink::forwardCommand(const std::string& token) {
    logDebug("Panel '" + config_.name + "' received: " + token);
    auto cmd = decodePanelLine(token);
    if (!cmd) {
        return;
    }
    if (endpoints_.commandTx.send(*cmd)) {
        return;
    }
    if (!commandChannelClosed_) {
        logLine("Panel '" + config_.name + "': simulation link offline, dropping " +
                panelCommandToString(*cmd));
        commandChannelClosed_ = true;
    }
}

std::optional<PanelError> PanelLink::pushState() {
    if (stateChannelClosed_) {
        return std::nullopt;
    }
    AircraftState state;
    switch (endpoints_.stateRx.tryReceive(state)) {
        case TryReceive::Empty:
            return std::nullopt;
        case TryReceive::Disconnected:
            logLine("Panel '" + config_.name + "': state channel closed");
            stateChannelClosed_ = true;
            return std::nullopt;
        case TryReceive::Item:
            break;
    }
    // Whole state goes out on any change.
    if (lastSent_ && *lastSent_ == state) {
        return std::nullopt;
    }
    std::vector<std::string> lines;
    switch (config_.type) {
        case PanelType::EventSim:
            lines = encodeEventSimState(state);
            break;
        case PanelType::Airspeed:
            lines.push_back(encodeAirspeedLine(state));
            break;
    }
    for (const auto& line : lines) {
        if (auto err = sendLine(line)) {
            return err;
        }
    }
    lastSent_ = state;
    return std::nullopt;
}

std::optional<PanelError> PanelLink::keepalive() {
    if (!traits_.keepalive) {
        return std::nullopt;
    }
    if (keepaliveDue(std::chrono::steady_clock::now() - lastLineSent_,
                     std::chrono::milliseconds(config_.keepaliveMs))) {
        return sendLine(kLinePing);
    }
    return std::nullopt;
}

void PanelLink::sleepInterruptible(std::chrono::milliseconds delay) {
    const auto until = std::chrono::steady_clock::now() + delay;
    while (!stopRequested() && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

}  // namespace panelbridge
