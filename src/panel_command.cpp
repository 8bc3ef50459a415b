#include "panel_command.h"

namespace panelbridge {

namespace {

const char* kParkingBrakeRatio = "sim/cockpit2/controls/parking_brake_ratio";

const std::array<PanelCommand, kPanelCommandCount> kAllCommands = {
    PanelCommand::LandingLightsOn,
    PanelCommand::LandingLightsOff,
    PanelCommand::TaxiLightsOn,
    PanelCommand::TaxiLightsOff,
    PanelCommand::StrobeLightsOn,
    PanelCommand::StrobeLightsOff,
    PanelCommand::NavLightsOn,
    PanelCommand::NavLightsOff,
    PanelCommand::FlapsUp,
    PanelCommand::FlapsDown,
    PanelCommand::ParkingBrakeOn,
    PanelCommand::ParkingBrakeOff,
    PanelCommand::LandingGearUp,
    PanelCommand::LandingGearDown,
};

}  // namespace

HostEvent hostEventFor(PanelCommand cmd) {
    switch (cmd) {
        case PanelCommand::LandingLightsOn: return {"sim/lights/landing_lights_on", 0};
        case PanelCommand::LandingLightsOff: return {"sim/lights/landing_lights_off", 0};
        case PanelCommand::TaxiLightsOn: return {"sim/lights/taxi_lights_on", 0};
        case PanelCommand::TaxiLightsOff: return {"sim/lights/taxi_lights_off", 0};
        case PanelCommand::StrobeLightsOn: return {"sim/lights/strobe_lights_on", 0};
        case PanelCommand::StrobeLightsOff: return {"sim/lights/strobe_lights_off", 0};
        case PanelCommand::NavLightsOn: return {"sim/lights/nav_lights_on", 0};
        case PanelCommand::NavLightsOff: return {"sim/lights/nav_lights_off", 0};
        case PanelCommand::FlapsUp: return {"sim/flight_controls/flaps_up", 0};
        case PanelCommand::FlapsDown: return {"sim/flight_controls/flaps_down", 0};
        case PanelCommand::ParkingBrakeOn: return {kParkingBrakeRatio, 1};
        case PanelCommand::ParkingBrakeOff: return {kParkingBrakeRatio, 0};
        case PanelCommand::LandingGearUp: return {"sim/flight_controls/landing_gear_up", 0};
        case PanelCommand::LandingGearDown: return {"sim/flight_controls/landing_gear_down", 0};
    }
    return {"", 0};
}

const char* panelCommandToString(PanelCommand cmd) {
    switch (cmd) {
        case PanelCommand::LandingLightsOn: return "LandingLightsOn";
        case PanelCommand::LandingLightsOff: return "LandingLightsOff";
        case PanelCommand::TaxiLightsOn: return "TaxiLightsOn";
        case PanelCommand::TaxiLightsOff: return "TaxiLightsOff";
        case PanelCommand::StrobeLightsOn: return "StrobeLightsOn";
        case PanelCommand::StrobeLightsOff: return "StrobeLightsOff";
        case PanelCommand::NavLightsOn: return "NavLightsOn";
        case PanelCommand::NavLightsOff: return "NavLightsOff";
        case PanelCommand::FlapsUp: return "FlapsUp";
        case PanelCommand::FlapsDown: return "FlapsDown";
        case PanelCommand::ParkingBrakeOn: return "ParkingBrakeOn";
        case PanelCommand::ParkingBrakeOff: return "ParkingBrakeOff";
        case PanelCommand::LandingGearUp: return "LandingGearUp";
        case PanelCommand::LandingGearDown: return "LandingGearDown";
    }
    return "Unknown";
}

const std::array<PanelCommand, kPanelCommandCount>& allPanelCommands() {
    return kAllCommands;
}

}  // namespace panelbridge
