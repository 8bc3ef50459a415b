#include "panel_protocol.h"

#include <cmath>

namespace panelbridge {

const char* const kLineSyn = "SYN";
const char* const kLineSynAck = "SYN|ACK";
const char* const kLineAck = "ACK";
const char* const kLineRst = "RST";
const char* const kLinePing = "PING";
const char* const kLinePong = "PONG";

const char* const kAirspeedBanner = "Name<Airspeed-Indicator>";

namespace {

struct PanelToken {
    const char* token;
    PanelCommand cmd;
};

const PanelToken kPanelTokens[] = {
    {"MISC1:0", PanelCommand::TaxiLightsOff},
    {"MISC1:1", PanelCommand::TaxiLightsOn},
    {"MISC2:0", PanelCommand::LandingLightsOff},
    {"MISC2:1", PanelCommand::LandingLightsOn},
    {"MISC3:0", PanelCommand::NavLightsOff},
    {"MISC3:1", PanelCommand::NavLightsOn},
    {"MISC4:0", PanelCommand::StrobeLightsOff},
    {"MISC4:1", PanelCommand::StrobeLightsOn},
    {"FLAPS_UP", PanelCommand::FlapsUp},
    {"FLAPS_DN", PanelCommand::FlapsDown},
    {"PARKING_BRAKE:0", PanelCommand::ParkingBrakeOff},
    {"PARKING_BRAKE:1", PanelCommand::ParkingBrakeOn},
    {"LANDING_GEAR:0", PanelCommand::LandingGearUp},
    {"LANDING_GEAR:1", PanelCommand::LandingGearDown},
};

}  // namespace

std::optional<PanelCommand> decodePanelLine(const std::string& line) {
    for (const auto& t : kPanelTokens) {
        if (line == t.token) {
            return t.cmd;
        }
    }
    return std::nullopt;
}

std::vector<std::string> encodeEventSimState(const AircraftState& state) {
    return {
        "PARKING_BRAKE:" + std::to_string(state.parkingBrake() ? 1 : 0),
        "FRONT_GEAR_LED:" + std::to_string(gearStatusToInt(state.gearCenter())),
        "LEFT_GEAR_LED:" + std::to_string(gearStatusToInt(state.gearLeft())),
        "RIGHT_GEAR_LED:" + std::to_string(gearStatusToInt(state.gearRight())),
    };
}

std::string encodeAirspeedLine(const AircraftState& state) {
    float kts = state.airspeed();
    int whole = 0;
    if (std::isfinite(kts) && kts > 0.0f) {
        whole = kts >= static_cast<float>(kMaxAirspeedKts) ? kMaxAirspeedKts : static_cast<int>(kts);
    }
    return "Type<I-A>::Target<Airspeed-Indicator>::Content<" + std::to_string(whole) + ">::Origin<Interface>;";
}

}  // namespace panelbridge
