#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "event_router.h"
#include "mock_sim_host.h"
#include "panel_command.h"
#include "sim_link.h"
#include "test_support.h"

using namespace panelbridge;

namespace {

struct SimHarness {
  MockSimHost host;
  EventRouter router;
  std::unique_ptr<SimLink> link;
  std::thread thread;

  explicit SimHarness(std::chrono::milliseconds reconnectDelay = std::chrono::milliseconds(20)) {
    SimLinkConfig cfg;
    cfg.clientName = "PanelBridgeTest";
    cfg.reconnectDelay = reconnectDelay;
    cfg.pollTimeout = std::chrono::milliseconds(2);
    link = std::make_unique<SimLink>(cfg, host, router.takeSimEndpoints());
  }

  ~SimHarness() { stop(); }

  void start() {
    SimLink* l = link.get();
    thread = std::thread([l] { l->run(); });
  }

  void stop() {
    link->requestStop();
    if (thread.joinable()) {
      thread.join();
    }
  }

  bool waitRegistered() {
    return test_wait_until([this] { return link->registered(); }, 2000);
  }
};

TelemetrySample gearDownSample(double airspeed, bool brake) {
  TelemetrySample s;
  s.gearCenterRatio = 1.0;
  s.gearLeftRatio = 1.0;
  s.gearRightRatio = 1.0;
  s.airspeedKts = airspeed;
  s.parkingBrakeIndicator = brake;
  return s;
}

}  // namespace

static void test_registers_all_commands() {
  SimHarness h;
  h.start();
  TEST_ASSERT(h.waitRegistered());
  TEST_ASSERT(h.link->state() == SimLinkState::Connected);
  TEST_ASSERT_EQ_STR(h.host.lastClientName(), "PanelBridgeTest");
  TEST_ASSERT_EQ_UINT(h.host.subscriptions(), 1);

  auto mapped = h.host.mapped();
  TEST_ASSERT_EQ_UINT(mapped.size(), kPanelCommandCount);
  for (PanelCommand cmd : allPanelCommands()) {
    TEST_ASSERT(mapped.count(hostEventId(cmd)) == 1);
    TEST_ASSERT_EQ_STR(mapped[hostEventId(cmd)], hostEventFor(cmd).name);
  }
  h.stop();
  TEST_ASSERT(h.link->state() == SimLinkState::Disconnected);
  TEST_ASSERT_EQ_UINT(h.host.disconnects(), 1);
}

static void test_state_broadcast_to_late_panel() {
  SimHarness h;
  h.start();
  TEST_ASSERT(h.waitRegistered());

  PanelEndpoints panel = h.router.attachPanel("eventsim");
  TEST_ASSERT(test_wait_until([&] { return h.link->panelCount() == 1; }, 2000));

  h.host.pushData(gearDownSample(121.0, true));
  AircraftState got;
  TEST_ASSERT(test_wait_until([&] { return panel.stateRx.tryReceive(got) == TryReceive::Item; }, 2000));
  TEST_ASSERT(got.parkingBrake());
  TEST_ASSERT(got.gearCenter() == LandingGearStatus::Down);
  TEST_ASSERT(got.airspeed() == 121.0f);
}

static void test_restarted_panel_gets_current_state() {
  SimHarness h;
  h.start();
  TEST_ASSERT(h.waitRegistered());

  {
    PanelEndpoints first = h.router.attachPanel("eventsim");
    TEST_ASSERT(test_wait_until([&] { return h.link->panelCount() == 1; }, 2000));
    h.host.pushData(gearDownSample(132.0, true));
    AircraftState got;
    TEST_ASSERT(test_wait_until([&] { return first.stateRx.tryReceive(got) == TryReceive::Item; }, 2000));
    TEST_ASSERT(got.airspeed() == 132.0f);
  }

  // No new telemetry arrives; the replacement panel must still see the last state.
  PanelEndpoints second = h.router.attachPanel("eventsim");
  AircraftState got;
  TEST_ASSERT(test_wait_until([&] { return second.stateRx.tryReceive(got) == TryReceive::Item; }, 500));
  TEST_ASSERT(got.parkingBrake());
  TEST_ASSERT(got.gearLeft() == LandingGearStatus::Down);
  TEST_ASSERT(got.airspeed() == 132.0f);
}

static void test_state_not_replayed_across_sessions() {
  SimHarness h;
  h.start();
  TEST_ASSERT(h.waitRegistered());
  h.host.pushData(gearDownSample(70.0, false));

  h.host.pushQuit();
  TEST_ASSERT(test_wait_until([&] { return h.host.connects() >= 2; }, 2000));
  TEST_ASSERT(h.waitRegistered());

  PanelEndpoints panel = h.router.attachPanel("eventsim");
  TEST_ASSERT(test_wait_until([&] { return h.link->panelCount() == 1; }, 2000));
  AircraftState got;
  TEST_ASSERT(panel.stateRx.tryReceive(got) == TryReceive::Empty);
}

static void test_unknown_notification_ignored() {
  SimHarness h;
  PanelEndpoints panel = h.router.attachPanel("eventsim");
  h.start();
  TEST_ASSERT(h.waitRegistered());

  SimNotification odd;
  odd.kind = SimNotification::Kind::Unknown;
  odd.detail = "id=42";
  h.host.push(odd);
  h.host.pushData(gearDownSample(101.0, false));

  AircraftState got;
  TEST_ASSERT(test_wait_until([&] { return panel.stateRx.tryReceive(got) == TryReceive::Item; }, 2000));
  TEST_ASSERT(got.airspeed() == 101.0f);
  TEST_ASSERT(h.link->registered());
  TEST_ASSERT_EQ_UINT(h.host.connects(), 1);
  TEST_ASSERT_EQ_UINT(h.host.disconnects(), 0);
}

static void test_commands_transmitted_with_payload() {
  SimHarness h;
  PanelEndpoints panel = h.router.attachPanel("eventsim");
  h.start();
  TEST_ASSERT(h.waitRegistered());

  TEST_ASSERT(panel.commandTx.send(PanelCommand::ParkingBrakeOn));
  TEST_ASSERT(panel.commandTx.send(PanelCommand::TaxiLightsOff));
  TEST_ASSERT(test_wait_until([&] { return h.host.transmitted().size() == 2; }, 2000));

  auto sent = h.host.transmitted();
  TEST_ASSERT_EQ_UINT(sent[0].first, hostEventId(PanelCommand::ParkingBrakeOn));
  TEST_ASSERT_EQ_UINT(sent[0].second, 1);
  TEST_ASSERT_EQ_UINT(sent[1].first, hostEventId(PanelCommand::TaxiLightsOff));
  TEST_ASSERT_EQ_UINT(sent[1].second, 0);
}

static void test_quit_triggers_reconnect() {
  SimHarness h;
  h.start();
  TEST_ASSERT(h.waitRegistered());
  h.host.pushQuit();
  TEST_ASSERT(test_wait_until([&] { return h.host.connects() >= 2; }, 2000));
  TEST_ASSERT(h.waitRegistered());
  TEST_ASSERT(h.host.disconnects() >= 1);
  TEST_ASSERT_EQ_UINT(h.host.subscriptions(), 2);
}

static void test_connect_failure_retries() {
  SimHarness h(std::chrono::milliseconds(5));
  h.host.setFailConnect(true);
  h.start();
  TEST_ASSERT(test_wait_until([&] { return h.link->connectAttempts() >= 3; }, 2000));
  TEST_ASSERT(!h.link->registered());
  TEST_ASSERT_EQ_UINT(h.host.disconnects(), 0);

  h.host.setFailConnect(false);
  TEST_ASSERT(h.waitRegistered());
}

static void test_mapping_failure_ends_session() {
  SimHarness h;
  h.host.setFailMapName("sim/flight_controls/flaps_up");
  h.start();
  TEST_ASSERT(test_wait_until([&] { return h.host.connects() >= 2; }, 2000));
  TEST_ASSERT(!h.link->registered());
  TEST_ASSERT(h.host.disconnects() >= 1);
}

static void test_dropped_panel_does_not_block_others() {
  SimHarness h;
  PanelEndpoints keep = h.router.attachPanel("keep");
  {
    PanelEndpoints gone = h.router.attachPanel("gone");
  }
  h.start();
  TEST_ASSERT(h.waitRegistered());
  TEST_ASSERT(test_wait_until([&] { return h.link->panelCount() == 2; }, 2000));

  h.host.pushData(gearDownSample(90.0, false));
  AircraftState got;
  TEST_ASSERT(test_wait_until([&] { return keep.stateRx.tryReceive(got) == TryReceive::Item; }, 2000));
  TEST_ASSERT(got.airspeed() == 90.0f);
  TEST_ASSERT(test_wait_until([&] { return h.link->panelCount() == 1; }, 2000));

  h.host.pushData(gearDownSample(95.0, false));
  TEST_ASSERT(test_wait_until([&] { return keep.stateRx.tryReceive(got) == TryReceive::Item; }, 2000));
  TEST_ASSERT(got.airspeed() == 95.0f);
}

static void test_no_panels_left_keeps_session() {
  SimHarness h;
  {
    PanelEndpoints panel = h.router.attachPanel("eventsim");
    h.router.close();
    h.start();
    TEST_ASSERT(h.waitRegistered());
  }
  // The command channel is now disconnected for good; the session stays up.
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  TEST_ASSERT(h.link->registered());
  TEST_ASSERT_EQ_UINT(h.host.connects(), 1);
}

static void test_stop_interrupts_backoff() {
  SimHarness h(std::chrono::milliseconds(10000));
  h.host.setFailConnect(true);
  h.start();
  TEST_ASSERT(test_wait_until([&] { return h.link->connectAttempts() >= 1; }, 2000));
  const auto begin = std::chrono::steady_clock::now();
  h.stop();
  const auto elapsed = std::chrono::steady_clock::now() - begin;
  TEST_ASSERT(elapsed < std::chrono::seconds(2));
  TEST_ASSERT_EQ_UINT(h.link->connectAttempts(), 1);
}

int main() {
  test_registers_all_commands();
  test_state_broadcast_to_late_panel();
  test_restarted_panel_gets_current_state();
  test_state_not_replayed_across_sessions();
  test_unknown_notification_ignored();
  test_commands_transmitted_with_payload();
  test_quit_triggers_reconnect();
  test_connect_failure_retries();
  test_mapping_failure_ends_session();
  test_dropped_panel_does_not_block_others();
  test_no_panels_left_keeps_session();
  test_stop_interrupts_backoff();
  return 0;
}
