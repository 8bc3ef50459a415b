#include "aircraft_state.h"

#include <iomanip>
#include <sstream>

namespace panelbridge {

bool operator==(const TelemetrySample& a, const TelemetrySample& b) {
    return a.gearCenterRatio == b.gearCenterRatio &&
           a.gearLeftRatio == b.gearLeftRatio &&
           a.gearRightRatio == b.gearRightRatio &&
           a.airspeedKts == b.airspeedKts &&
           a.parkingBrakeIndicator == b.parkingBrakeIndicator;
}

bool operator!=(const TelemetrySample& a, const TelemetrySample& b) {
    return !(a == b);
}

// Only fully retracted or fully extended count; anything in transit is unknown.
LandingGearStatus gearStatusFromRatio(double ratio) {
    if (ratio == 0.0) {
        return LandingGearStatus::Up;
    }
    if (ratio == 1.0) {
        return LandingGearStatus::Down;
    }
    return LandingGearStatus::Unknown;
}

int gearStatusToInt(LandingGearStatus status) {
    switch (status) {
        case LandingGearStatus::Up: return 0;
        case LandingGearStatus::Down: return 1;
        case LandingGearStatus::Unknown: return 2;
    }
    return 2;
}

const char* gearStatusToString(LandingGearStatus status) {
    switch (status) {
        case LandingGearStatus::Up: return "up";
        case LandingGearStatus::Down: return "down";
        case LandingGearStatus::Unknown: return "unknown";
    }
    return "unknown";
}

AircraftState AircraftState::fromTelemetry(const TelemetrySample& sample) {
    return AircraftState(sample.parkingBrakeIndicator,
                         gearStatusFromRatio(sample.gearCenterRatio),
                         gearStatusFromRatio(sample.gearLeftRatio),
                         gearStatusFromRatio(sample.gearRightRatio),
                         static_cast<float>(sample.airspeedKts));
}

AircraftState::AircraftState(bool parkingBrake,
                             LandingGearStatus gearCenter,
                             LandingGearStatus gearLeft,
                             LandingGearStatus gearRight,
                             float airspeed)
    : parkingBrake_(parkingBrake),
      gearCenter_(gearCenter),
      gearLeft_(gearLeft),
      gearRight_(gearRight),
      airspeed_(airspeed) {}

std::string AircraftState::describe() const {
    std::ostringstream oss;
    oss << "parking_brake=" << (parkingBrake_ ? 1 : 0)
        << ", gear=" << gearStatusToString(gearCenter_) << "/" << gearStatusToString(gearLeft_) << "/"
        << gearStatusToString(gearRight_)
        << ", airspeed=" << std::fixed << std::setprecision(1) << airspeed_;
    return oss.str();
}

bool AircraftState::operator==(const AircraftState& other) const {
    return parkingBrake_ == other.parkingBrake_ &&
           gearCenter_ == other.gearCenter_ &&
           gearLeft_ == other.gearLeft_ &&
           gearRight_ == other.gearRight_ &&
           airspeed_ == other.airspeed_;
}

}  // namespace panelbridge
