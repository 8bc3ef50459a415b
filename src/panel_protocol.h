#pragma once

#include "aircraft_state.h"
#include "panel_command.h"

#include <optional>
#include <string>
#include <vector>

namespace panelbridge {

// Control tokens of the newline-terminated panel line protocol.
extern const char* const kLineSyn;
extern const char* const kLineSynAck;
extern const char* const kLineAck;
extern const char* const kLineRst;
extern const char* const kLinePing;
extern const char* const kLinePong;

// Identification sent by the airspeed indicator after reset, terminated by
// kAirspeedBannerTerminator.
extern const char* const kAirspeedBanner;
constexpr char kAirspeedBannerTerminator = ';';

// Panel -> bridge command token. Unknown tokens yield nullopt.
std::optional<PanelCommand> decodePanelLine(const std::string& line);

// Bridge -> panel state lines of the EventSim panel, in write order.
std::vector<std::string> encodeEventSimState(const AircraftState& state);

// Airspeed is truncated to whole knots and clamped to 0..kMaxAirspeedKts;
// non-finite values read as 0.
constexpr int kMaxAirspeedKts = 9999;
std::string encodeAirspeedLine(const AircraftState& state);

}  // namespace panelbridge
