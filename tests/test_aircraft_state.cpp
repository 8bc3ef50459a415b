#include <cstring>
#include <set>
#include <string>

#include "aircraft_state.h"
#include "panel_command.h"
#include "test_support.h"

using namespace panelbridge;

static void test_gear_status_from_ratio() {
  TEST_ASSERT(gearStatusFromRatio(0.0) == LandingGearStatus::Up);
  TEST_ASSERT(gearStatusFromRatio(1.0) == LandingGearStatus::Down);
  TEST_ASSERT(gearStatusFromRatio(0.5) == LandingGearStatus::Unknown);
  TEST_ASSERT(gearStatusFromRatio(0.0001) == LandingGearStatus::Unknown);
  TEST_ASSERT(gearStatusFromRatio(0.9999) == LandingGearStatus::Unknown);
}

static void test_gear_status_wire_values() {
  TEST_ASSERT_EQ_UINT(gearStatusToInt(LandingGearStatus::Up), 0);
  TEST_ASSERT_EQ_UINT(gearStatusToInt(LandingGearStatus::Down), 1);
  TEST_ASSERT_EQ_UINT(gearStatusToInt(LandingGearStatus::Unknown), 2);
}

static void test_state_from_telemetry() {
  TelemetrySample sample;
  sample.gearCenterRatio = 1.0;
  sample.gearLeftRatio = 0.0;
  sample.gearRightRatio = 0.42;
  sample.airspeedKts = 143.7;
  sample.parkingBrakeIndicator = true;

  AircraftState state = AircraftState::fromTelemetry(sample);
  TEST_ASSERT(state.parkingBrake());
  TEST_ASSERT(state.gearCenter() == LandingGearStatus::Down);
  TEST_ASSERT(state.gearLeft() == LandingGearStatus::Up);
  TEST_ASSERT(state.gearRight() == LandingGearStatus::Unknown);
  TEST_ASSERT(state.airspeed() > 143.6f && state.airspeed() < 143.8f);
}

static void test_state_equality() {
  AircraftState a(false, LandingGearStatus::Down, LandingGearStatus::Down, LandingGearStatus::Down, 0.0f);
  AircraftState b(false, LandingGearStatus::Down, LandingGearStatus::Down, LandingGearStatus::Down, 0.0f);
  AircraftState c(true, LandingGearStatus::Down, LandingGearStatus::Down, LandingGearStatus::Down, 0.0f);
  AircraftState d(false, LandingGearStatus::Down, LandingGearStatus::Down, LandingGearStatus::Down, 1.0f);
  TEST_ASSERT(a == b);
  TEST_ASSERT(a != c);
  TEST_ASSERT(a != d);
}

static void test_describe() {
  AircraftState state(true, LandingGearStatus::Up, LandingGearStatus::Unknown, LandingGearStatus::Down, 120.5f);
  TEST_ASSERT_EQ_STR(state.describe(), "parking_brake=1, gear=up/unknown/down, airspeed=120.5");
}

static void test_command_table_complete() {
  std::set<uint32_t> ids;
  for (PanelCommand cmd : allPanelCommands()) {
    HostEvent event = hostEventFor(cmd);
    TEST_ASSERT(event.name != nullptr && std::strlen(event.name) > 0);
    TEST_ASSERT(std::strcmp(panelCommandToString(cmd), "Unknown") != 0);
    ids.insert(hostEventId(cmd));
  }
  TEST_ASSERT_EQ_UINT(ids.size(), kPanelCommandCount);
}

static void test_command_table_entries() {
  HostEvent on = hostEventFor(PanelCommand::ParkingBrakeOn);
  HostEvent off = hostEventFor(PanelCommand::ParkingBrakeOff);
  TEST_ASSERT_EQ_STR(on.name, "sim/cockpit2/controls/parking_brake_ratio");
  TEST_ASSERT_EQ_STR(off.name, "sim/cockpit2/controls/parking_brake_ratio");
  TEST_ASSERT_EQ_UINT(on.data, 1);
  TEST_ASSERT_EQ_UINT(off.data, 0);

  TEST_ASSERT_EQ_STR(hostEventFor(PanelCommand::TaxiLightsOn).name, "sim/lights/taxi_lights_on");
  TEST_ASSERT_EQ_STR(hostEventFor(PanelCommand::LandingGearDown).name, "sim/flight_controls/landing_gear_down");
  TEST_ASSERT_EQ_STR(hostEventFor(PanelCommand::FlapsUp).name, "sim/flight_controls/flaps_up");
  TEST_ASSERT_EQ_UINT(hostEventFor(PanelCommand::StrobeLightsOff).data, 0);
}

int main() {
  test_gear_status_from_ratio();
  test_gear_status_wire_values();
  test_state_from_telemetry();
  test_state_equality();
  test_describe();
  test_command_table_complete();
  test_command_table_entries();
  return 0;
}
