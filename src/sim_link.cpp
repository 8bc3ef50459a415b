#include "sim_link.h"

#include "log.h"
#include "panel_command.h"

namespace panelbridge {

const char* simLinkStateToString(SimLinkState state) {
    switch (state) {
        case SimLinkState::Disconnected: return "disconnected";
        case SimLinkState::Connecting: return "connecting";
        case SimLinkState::Connected: return "connected";
    }
    return "unknown";
}

SimLink::SimLink(SimLinkConfig config, SimHost& host, SimEndpoints endpoints)
    : config_(std::move(config)), host_(host), endpoints_(std::move(endpoints)) {}

void SimLink::run() {
    while (!stopRequested()) {
        acceptNewPanels();
        setState(SimLinkState::Connecting);
        ++connectAttempts_;
        logDebug("Sim: attempting to connect as '" + config_.clientName + "'");
        std::string err;
        if (host_.connect(config_.clientName, err)) {
            switch (runSession(err)) {
                case SessionEnd::Stopped:
                    break;
                case SessionEnd::Quit:
                    logLine("Sim: disconnected from simulator");
                    break;
                case SessionEnd::Error:
                    logLine("Sim: communication error: " + err);
                    break;
            }
            host_.disconnect();
        } else {
            logLine("Sim: failed to connect: " + err);
        }

        connected_.store(false);
        lastState_.reset();
        setState(SimLinkState::Disconnected);
        if (stopRequested()) {
            break;
        }
        waitBackoff();
    }
    setState(SimLinkState::Disconnected);
}

void SimLink::setState(SimLinkState state) {
    SimLinkState prev = state_.exchange(state);
    if (prev != state) {
        logDebug(std::string("Sim: ") + simLinkStateToString(prev) + " -> " + simLinkStateToString(state));
    }
}

void SimLink::requestStop() {
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        stop_.store(true);
    }
    waitCv_.notify_all();
}

void SimLink::waitBackoff() {
    std::unique_lock<std::mutex> lock(waitMutex_);
    waitCv_.wait_for(lock, config_.reconnectDelay, [this] { return stop_.load(); });
}

SimLink::SessionEnd SimLink::runSession(std::string& err) {
    while (!stopRequested()) {
        acceptNewPanels();

        if (connected_.load() && !forwardCommand(err)) {
            return SessionEnd::Error;
        }

        SimNotification notification;
        switch (host_.nextNotification(notification, config_.pollTimeout, err)) {
            case PollStatus::None:
                continue;
            case PollStatus::Error:
                return SessionEnd::Error;
            case PollStatus::Notification:
                break;
        }

        switch (notification.kind) {
            case SimNotification::Kind::Open:
                logLine("Sim: connection with flight simulator established");
                if (!registerWithHost(err)) {
                    return SessionEnd::Error;
                }
                connected_.store(true);
                setState(SimLinkState::Connected);
                break;
            case SimNotification::Kind::Quit:
                return SessionEnd::Quit;
            case SimNotification::Kind::Data: {
                AircraftState state = AircraftState::fromTelemetry(notification.sample);
                logDebug("Sim: aircraft state " + state.describe());
                broadcast(state);
                break;
            }
            case SimNotification::Kind::Unknown:
                logLine("Sim: ignoring notification " + notification.detail);
                break;
        }
    }
    return SessionEnd::Stopped;
}

bool SimLink::registerWithHost(std::string& err) {
    if (!host_.subscribeAircraftState(err)) {
        err = "subscribing aircraft state: " + err;
        return false;
    }
    for (PanelCommand cmd : allPanelCommands()) {
        const HostEvent event = hostEventFor(cmd);
        if (!host_.mapEvent(hostEventId(cmd), event.name, err)) {
            err = std::string("mapping ") + panelCommandToString(cmd) + " to " + event.name + ": " + err;
            return false;
        }
    }
    return true;
}

bool SimLink::forwardCommand(std::string& err) {
    if (commandsClosed_) {
        return true;
    }
    PanelCommand cmd{};
    switch (endpoints_.commandRx.tryReceive(cmd)) {
        case TryReceive::Empty:
            return true;
        case TryReceive::Disconnected:
            // Permanent: no panel will ever send again.
            logLine("Sim: no panel can send commands anymore");
            commandsClosed_ = true;
            return true;
        case TryReceive::Item:
            break;
    }
    const HostEvent event = hostEventFor(cmd);
    logDebug(std::string("Sim: transmitting ") + panelCommandToString(cmd) + " (" + event.name +
             ", data=" + std::to_string(event.data) + ")");
    if (!host_.transmitEvent(hostEventId(cmd), event.data, err)) {
        err = std::string("transmitting ") + panelCommandToString(cmd) + ": " + err;
        return false;
    }
    return true;
}

void SimLink::acceptNewPanels() {
    StateTarget target;
    while (endpoints_.attachRx.tryReceive(target) == TryReceive::Item) {
        logDebug("Sim: panel '" + target.name + "' attached");
        if (lastState_ && !target.tx.send(*lastState_)) {
            logLine("Sim: panel '" + target.name + "' is gone, removed from broadcast");
            continue;
        }
        targets_.push_back(std::move(target));
    }
    panelCount_.store(targets_.size());
}

void SimLink::broadcast(const AircraftState& state) {
    lastState_ = state;
    std::vector<std::string> dropped;
    fanOutState(targets_, state, dropped);
    for (const auto& name : dropped) {
        logLine("Sim: panel '" + name + "' is gone, removed from broadcast");
    }
    panelCount_.store(targets_.size());
}

}  // namespace panelbridge
