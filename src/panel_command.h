#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace panelbridge {

enum class PanelCommand : uint32_t {
    LandingLightsOn,
    LandingLightsOff,
    TaxiLightsOn,
    TaxiLightsOff,
    StrobeLightsOn,
    StrobeLightsOff,
    NavLightsOn,
    NavLightsOff,
    FlapsUp,
    FlapsDown,
    ParkingBrakeOn,
    ParkingBrakeOff,
    LandingGearUp,
    LandingGearDown,
};

constexpr std::size_t kPanelCommandCount = 14;

struct HostEvent {
    const char* name;  // X-Plane command or dataref path
    uint32_t data;
};

// Host event identifier and payload for a command.
HostEvent hostEventFor(PanelCommand cmd);

// Numeric id used when mapping and transmitting host events.
inline uint32_t hostEventId(PanelCommand cmd) {
    return static_cast<uint32_t>(cmd);
}

const char* panelCommandToString(PanelCommand cmd);

const std::array<PanelCommand, kPanelCommandCount>& allPanelCommands();

}  // namespace panelbridge
