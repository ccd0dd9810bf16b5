#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "dronefleet/core/errors.h"
#include "dronefleet/core/scenario.h"
#include "dronefleet/core/simulation.h"
#include "dronefleet/util/json.h"
#include "dronefleet/util/log.h"
#include "dronefleet/util/state_export.h"

#define DF_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

int count_events(const dronefleet::World& w, dronefleet::EventType type, const std::string& agent_id) {
  int n = 0;
  for (const auto& ev : w.events) {
    if (ev.type == type && ev.agent_id == agent_id) ++n;
  }
  return n;
}

dronefleet::PathTask fire_square_patrol() {
  dronefleet::PathTask p;
  p.waypoints = {{42.0, 42.0}, {58.0, 42.0}, {58.0, 58.0}, {42.0, 58.0}};
  p.loop = true;
  return p;
}

std::string state_text(const dronefleet::Simulation& sim) {
  return dronefleet::json::stringify(dronefleet::snapshot_to_json(sim.snapshot(0)), 0);
}

// Expects CommandError of `kind`; returns its message or "" if nothing threw.
template <typename Fn>
std::string command_error_message(Fn&& fn, dronefleet::ErrorKind kind) {
  try {
    fn();
  } catch (const dronefleet::CommandError& e) {
    if (e.kind() != kind) return "wrong kind";
    return e.what();
  }
  return {};
}

} // namespace

int test_simulation() {
  using namespace dronefleet;

  log::Level saved_level = log::level();
  log::set_level(log::Level::Off);

  // Perimeter patrol of the fire zone never leaves it: one FIRE_DETECTED for
  // the whole 600 s dwell.
  {
    Simulation sim(make_demo_scenario(), SimConfig{});
    sim.assign_task("D1", fire_square_patrol());
    sim.step(3000);

    DF_ASSERT(sim.world().tick == 3000);
    DF_ASSERT(count_events(sim.world(), EventType::FireDetected, "D1") == 1);
    for (const auto& ev : sim.world().events) DF_ASSERT(ev.agent_id == "D1");
    DF_ASSERT(sim.world().events.begin()->payload.at("entering").bool_value());

    const Agent& d1 = sim.world().agents.at("D1");
    DF_ASSERT(d1.status == AgentStatus::Navigating);
    DF_ASSERT(d1.task.has_value());
    DF_ASSERT(d1.battery < 100.0);
  }

  // GOTO into the zone: entry fires once, the parked drone stays quiet.
  {
    Simulation sim(make_demo_scenario(), SimConfig{});
    GotoTask g;
    g.target = {50.0, 50.0};
    sim.assign_task("D1", g);
    sim.step(400);

    const Agent& d1 = sim.world().agents.at("D1");
    DF_ASSERT(d1.status == AgentStatus::Idle);
    DF_ASSERT(!d1.task.has_value());
    DF_ASSERT(distance(d1.position, {50.0, 50.0}) <= 2.0 + 1e-9);

    sim.step(600);
    DF_ASSERT(count_events(sim.world(), EventType::FireDetected, "D1") == 1);

    const WorldEvent& ev = *sim.world().events.begin();
    DF_ASSERT(ev.seq == 1);
    DF_ASSERT(ev.severity >= 0.5 && ev.severity <= 0.75);
    DF_ASSERT(ev.confidence >= 0.7 && ev.confidence <= 0.9);
    DF_ASSERT(ev.payload.at("zone_id").string_value() == "z_fire");
  }

  // World time is tick * dt, and events never post-date the snapshot.
  {
    Simulation sim(make_demo_scenario(), SimConfig{});
    sim.assign_task("D1", fire_square_patrol());
    sim.step(37);
    DF_ASSERT(sim.world().time_s == 37 * 0.2);
    sim.step(0);
    sim.step(-5);
    DF_ASSERT(sim.world().tick == 37);

    sim.step(963);
    const WorldSnapshot snap = sim.snapshot(0);
    DF_ASSERT(snap.tick == 1000);
    DF_ASSERT(!snap.recent_events.empty());
    for (const auto& ev : snap.recent_events) DF_ASSERT(ev.ts <= snap.time_s);
  }

  // Battery drains only while busy, floors at 0 and reports low once.
  {
    SimConfig cfg;
    cfg.battery_drain_per_s = 50.0;
    Simulation sim(make_demo_scenario(), cfg);

    HoldTask h;
    h.agent_id = "D1";
    sim.assign_task("D1", h);
    DF_ASSERT(sim.world().agents.at("D1").status == AgentStatus::Holding);

    sim.step(2);
    DF_ASSERT(std::abs(sim.world().agents.at("D1").battery - 80.0) < 1e-9);

    sim.step(20);
    DF_ASSERT(sim.world().agents.at("D1").battery == 0.0);
    DF_ASSERT(sim.world().agents.at("D2").battery == 100.0);
    DF_ASSERT(count_events(sim.world(), EventType::BatteryLow, "D1") == 1);
    DF_ASSERT(count_events(sim.world(), EventType::BatteryLow, "D2") == 0);
  }

  // Unknown drone: NotFound and nothing changes.
  {
    Simulation sim(make_demo_scenario(), SimConfig{});
    sim.step(3);
    const std::string before = state_text(sim);

    GotoTask g;
    g.target = {10.0, 10.0};
    const std::string msg = command_error_message([&] { sim.assign_task("D9", g); }, ErrorKind::NotFound);
    DF_ASSERT(msg == "Unknown drone_id=D9");
    DF_ASSERT(!command_error_message([&] { sim.cancel_task("D9"); }, ErrorKind::NotFound).empty());
    DF_ASSERT(state_text(sim) == before);
  }

  // Rejected assignments leave the previous task in place.
  {
    Simulation sim(make_demo_scenario(), SimConfig{});
    PathTask keep = fire_square_patrol();
    keep.id = "patrol";
    sim.assign_task("D1", keep);
    sim.step(5);
    const std::string before = state_text(sim);

    GotoTask outside;
    outside.target = {150.0, 10.0};
    DF_ASSERT(!command_error_message([&] { sim.assign_task("D1", outside); }, ErrorKind::InvalidTask).empty());

    GotoTask bad_eps;
    bad_eps.target = {10.0, 10.0};
    bad_eps.arrive_eps = 0.0;
    DF_ASSERT(!command_error_message([&] { sim.assign_task("D1", bad_eps); }, ErrorKind::InvalidTask).empty());

    GotoTask nan_target;
    nan_target.target = {std::nan(""), 10.0};
    DF_ASSERT(!command_error_message([&] { sim.assign_task("D1", nan_target); }, ErrorKind::InvalidTask).empty());

    PathTask empty;
    DF_ASSERT(!command_error_message([&] { sim.assign_task("D1", empty); }, ErrorKind::InvalidTask).empty());

    HoldTask other;
    other.agent_id = "D2";
    const std::string msg = command_error_message([&] { sim.assign_task("D1", other); }, ErrorKind::InvalidTask);
    DF_ASSERT(msg.find("does not match") != std::string::npos);

    DF_ASSERT(state_text(sim) == before);
    DF_ASSERT(task_id(*sim.world().agents.at("D1").task) == "patrol");
  }

  // Auto ids come from world time; PATH cursor restarts on reassignment.
  {
    Simulation sim(make_demo_scenario(), SimConfig{});
    GotoTask g;
    g.target = {90.0, 90.0};
    DF_ASSERT(task_id(sim.assign_task("D1", g)) == "goto_0");

    sim.step(10);
    DF_ASSERT(task_id(sim.assign_task("D1", g)) == "goto_20");

    HoldTask h;
    h.agent_id = "D2";
    h.id = "custom";
    DF_ASSERT(task_id(sim.assign_task("D2", h)) == "custom");

    PathTask p;
    p.waypoints = {{95.0, 5.0}, {95.0, 10.0}};
    p.loop = false;
    sim.assign_task("D2", p);
    sim.step(5);
    const auto& stored = std::get<PathTask>(*sim.world().agents.at("D2").task);
    DF_ASSERT(stored.cursor == 1);

    p.cursor = 1;
    const Task assigned = sim.assign_task("D2", p);
    DF_ASSERT(std::get<PathTask>(assigned).cursor == 0);
    DF_ASSERT(std::get<PathTask>(*sim.world().agents.at("D2").task).cursor == 0);
  }

  // Cancel returns the drone to IDLE.
  {
    Simulation sim(make_demo_scenario(), SimConfig{});
    DF_ASSERT(!sim.cancel_task("D3").has_value());
    sim.assign_task("D3", fire_square_patrol());
    sim.step(2);
    const auto prev = sim.cancel_task("D3");
    DF_ASSERT(prev.has_value());
    DF_ASSERT(task_kind(*prev) == TaskKind::Path);
    DF_ASSERT(sim.world().agents.at("D3").status == AgentStatus::Idle);
    const Vec2 parked = sim.world().agents.at("D3").position;
    sim.step(10);
    DF_ASSERT(sim.world().agents.at("D3").position == parked);
  }

  // A corrupt task reaching the tick holds the drone and is reported once.
  {
    World w = make_demo_scenario();
    PathTask broken;
    broken.id = "broken";
    broken.waypoints = {{10.0, 10.0}};
    broken.cursor = 7;
    w.agents["D1"].task = broken;
    w.agents["D1"].status = AgentStatus::Navigating;

    std::vector<std::string> warnings;
    log::set_level(log::Level::Warn);
    log::set_sink([&](log::Level lvl, const std::string& msg) {
      if (lvl == log::Level::Warn) warnings.push_back(msg);
    });

    Simulation sim(std::move(w), SimConfig{});
    const Vec2 start = sim.world().agents.at("D1").position;
    sim.step(10);

    log::set_sink({});
    log::set_level(log::Level::Off);

    DF_ASSERT(warnings.size() == 1);
    DF_ASSERT(warnings[0].find("broken") != std::string::npos);
    DF_ASSERT(count_events(sim.world(), EventType::TaskFault, "D1") == 1);
    DF_ASSERT(sim.world().agents.at("D1").status == AgentStatus::Holding);
    DF_ASSERT(sim.world().agents.at("D1").position == start);

    // A fresh assignment clears the fault.
    GotoTask g;
    g.target = {6.0, 6.0};
    sim.assign_task("D1", g);
    sim.step(10);
    DF_ASSERT(sim.world().agents.at("D1").status == AgentStatus::Idle);
  }

  // Bad construction input is rejected up front.
  {
    SimConfig cfg;
    cfg.tick_seconds = 0.0;
    bool threw = false;
    try {
      Simulation sim(make_demo_scenario(), cfg);
    } catch (const std::runtime_error& e) {
      threw = std::string(e.what()).find("tick_seconds") != std::string::npos;
    }
    DF_ASSERT(threw);

    threw = false;
    try {
      Simulation sim(World(), SimConfig{});
    } catch (const std::runtime_error& e) {
      threw = std::string(e.what()).find("no drones") != std::string::npos;
    }
    DF_ASSERT(threw);
  }

  log::set_level(saved_level);
  return 0;
}
