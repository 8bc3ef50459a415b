#pragma once

#include "aircraft_state.h"
#include "channel.h"
#include "panel_command.h"

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace panelbridge {

// One entry of the simulation link's fan-out list.
struct StateTarget {
    std::string name;
    Sender<AircraftState> tx;
};

// Channel ends handed to a panel link.
struct PanelEndpoints {
    std::string name;
    Receiver<AircraftState> stateRx;
    Sender<PanelCommand> commandTx;
};

// Channel ends handed to the simulation link.
struct SimEndpoints {
    Receiver<PanelCommand> commandRx;
    Receiver<StateTarget> attachRx;
};

class EventRouter {
public:
    EventRouter();

    // Creates the panel's state channel and announces its sender to the
    // simulation link through the attach channel.
    PanelEndpoints attachPanel(const std::string& name);

    // The receiving ends exist once; later calls return invalid receivers.
    SimEndpoints takeSimEndpoints();

    // Drops the router's own senders. Afterwards the command channel reports
    // Disconnected once every attached panel has gone.
    void close();

private:
    std::mutex mutex_;
    Sender<PanelCommand> commandTx_;
    Sender<StateTarget> attachTx_;
    Receiver<PanelCommand> commandRx_;
    Receiver<StateTarget> attachRx_;
};

// Sends a copy of the state to every target. Targets whose receiver is gone
// are removed and their names appended to `dropped`. Returns the number of
// successful deliveries.
std::size_t fanOutState(std::vector<StateTarget>& targets,
                        const AircraftState& state,
                        std::vector<std::string>& dropped);

}  // namespace panelbridge
