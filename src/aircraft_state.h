#pragma once

#include <string>

namespace panelbridge {

enum class LandingGearStatus { Unknown, Up, Down };

// Raw telemetry as delivered by the simulation host. Always complete.
struct TelemetrySample {
    double gearCenterRatio = 0.0;
    double gearLeftRatio = 0.0;
    double gearRightRatio = 0.0;
    double airspeedKts = 0.0;
    bool parkingBrakeIndicator = false;
};

bool operator==(const TelemetrySample& a, const TelemetrySample& b);
bool operator!=(const TelemetrySample& a, const TelemetrySample& b);

LandingGearStatus gearStatusFromRatio(double ratio);
// Wire encoding used by the gear LED lines: Up=0, Down=1, Unknown=2.
int gearStatusToInt(LandingGearStatus status);
const char* gearStatusToString(LandingGearStatus status);

class AircraftState {
public:
    static AircraftState fromTelemetry(const TelemetrySample& sample);

    AircraftState() = default;
    AircraftState(bool parkingBrake,
                  LandingGearStatus gearCenter,
                  LandingGearStatus gearLeft,
                  LandingGearStatus gearRight,
                  float airspeed);

    bool parkingBrake() const { return parkingBrake_; }
    LandingGearStatus gearCenter() const { return gearCenter_; }
    LandingGearStatus gearLeft() const { return gearLeft_; }
    LandingGearStatus gearRight() const { return gearRight_; }
    float airspeed() const { return airspeed_; }

    std::string describe() const;

    bool operator==(const AircraftState& other) const;
    bool operator!=(const AircraftState& other) const { return !(*this == other); }

private:
    bool parkingBrake_ = false;
    LandingGearStatus gearCenter_ = LandingGearStatus::Unknown;
    LandingGearStatus gearLeft_ = LandingGearStatus::Unknown;
    LandingGearStatus gearRight_ = LandingGearStatus::Unknown;
    float airspeed_ = 0.0f;
};

}  // namespace panelbridge
