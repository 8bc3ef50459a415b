#include "event_router.h"

#include "log.h"

namespace panelbridge {

EventRouter::EventRouter() {
    auto [cmdTx, cmdRx] = Channel<PanelCommand>::create();
    auto [attTx, attRx] = Channel<StateTarget>::create();
    commandTx_ = std::move(cmdTx);
    commandRx_ = std::move(cmdRx);
    attachTx_ = std::move(attTx);
    attachRx_ = std::move(attRx);
}

PanelEndpoints EventRouter::attachPanel(const std::string& name) {
    auto [stateTx, stateRx] = Channel<AircraftState>::create();
    PanelEndpoints endpoints;
    endpoints.name = name;
    endpoints.stateRx = std::move(stateRx);

    std::lock_guard<std::mutex> lock(mutex_);
    endpoints.commandTx = commandTx_;
    if (!attachTx_.send(StateTarget{name, std::move(stateTx)})) {
        logLine("Router: simulation link gone, panel '" + name + "' will not receive state");
    }
    return endpoints;
}

SimEndpoints EventRouter::takeSimEndpoints() {
    std::lock_guard<std::mutex> lock(mutex_);
    SimEndpoints endpoints;
    endpoints.commandRx = std::move(commandRx_);
    endpoints.attachRx = std::move(attachRx_);
    return endpoints;
}

void EventRouter::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    commandTx_ = Sender<PanelCommand>();
    attachTx_ = Sender<StateTarget>();
}

std::size_t fanOutState(std::vector<StateTarget>& targets,
                        const AircraftState& state,
                        std::vector<std::string>& dropped) {
    std::size_t delivered = 0;
    for (auto it = targets.begin(); it != targets.end();) {
        if (it->tx.send(state)) {
            ++delivered;
            ++it;
        } else {
            dropped.push_back(it->name);
            it = targets.erase(it);
        }
    }
    return delivered;
}

}  // namespace panelbridge
