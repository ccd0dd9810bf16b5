#include <cmath>
#include <iostream>
#include <string>

#include "dronefleet/core/task_machine.h"
#include "dronefleet/core/world.h"

#define DF_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

constexpr double kDt = 0.2;
constexpr double kSpeed = 1.6;

dronefleet::Agent make_agent(const dronefleet::Vec2& pos) {
  dronefleet::Agent a;
  a.id = "D1";
  a.position = pos;
  a.home = pos;
  return a;
}

} // namespace

int test_task_machine() {
  using namespace dronefleet;
  const WorldBounds bounds{100.0, 100.0};

  // GOTO converges, goes IDLE, and stays put afterwards.
  {
    Agent a = make_agent({5.0, 5.0});
    a.task = GotoTask{"g", {40.0, 25.0}, 2.0};
    a.status = AgentStatus::Navigating;

    int ticks = 0;
    bool completed = false;
    while (ticks < 1000 && !completed) {
      const auto res = step_agent_task(a, kDt, kSpeed, bounds);
      completed = res.completed;
      if (completed) DF_ASSERT(res.task_id == "g");
      ++ticks;
    }
    DF_ASSERT(completed);
    DF_ASSERT(!a.task.has_value());
    DF_ASSERT(a.status == AgentStatus::Idle);
    DF_ASSERT(distance(a.position, {40.0, 25.0}) <= 2.0);

    const Vec2 rest = a.position;
    for (int i = 0; i < 50; ++i) {
      const auto res = step_agent_task(a, kDt, kSpeed, bounds);
      DF_ASSERT(!res.completed);
    }
    DF_ASSERT(a.position == rest);
    DF_ASSERT(a.status == AgentStatus::Idle);
  }

  // Motion per tick is capped at speed * dt.
  {
    Agent a = make_agent({10.0, 10.0});
    a.task = GotoTask{"g", {90.0, 10.0}, 2.0};
    (void)step_agent_task(a, kDt, kSpeed, bounds);
    DF_ASSERT(std::abs(a.position.x - (10.0 + kSpeed * kDt)) < 1e-9);
    DF_ASSERT(a.position.y == 10.0);
    DF_ASSERT(a.status == AgentStatus::Navigating);
  }

  // A GOTO to the current position completes on the first evaluation.
  {
    Agent a = make_agent({30.0, 30.0});
    a.task = GotoTask{"here", {30.0, 30.0}, 2.0};
    const auto res = step_agent_task(a, kDt, kSpeed, bounds);
    DF_ASSERT(res.completed);
    DF_ASSERT(a.status == AgentStatus::Idle);
    DF_ASSERT(a.position == Vec2(30.0, 30.0));
  }

  // Looping PATH: cursor stays in range, wraps to 0, never completes.
  {
    Agent a = make_agent({10.0, 10.0});
    a.task = PathTask{"loop", {{10.0, 10.0}, {14.0, 10.0}, {14.0, 14.0}}, true, 0};

    int wraps = 0;
    int last_cursor = 0;
    int visits_in_order = 0;
    for (int i = 0; i < 2000; ++i) {
      const auto res = step_agent_task(a, kDt, kSpeed, bounds);
      DF_ASSERT(!res.completed);
      DF_ASSERT(!res.fault);
      DF_ASSERT(a.task.has_value());
      const int cursor = std::get<PathTask>(*a.task).cursor;
      DF_ASSERT(cursor >= 0 && cursor <= 2);
      if (cursor != last_cursor) {
        // Always the next waypoint, modulo the path length.
        DF_ASSERT(cursor == (last_cursor + 1) % 3);
        ++visits_in_order;
        if (cursor == 0) ++wraps;
      }
      last_cursor = cursor;
    }
    DF_ASSERT(wraps >= 2);
    DF_ASSERT(visits_in_order >= 6);
    DF_ASSERT(a.status == AgentStatus::Navigating);
  }

  // Non-looping PATH completes after its last waypoint and stops moving.
  {
    Agent a = make_agent({5.0, 10.0});
    a.task = PathTask{"once", {{10.0, 10.0}, {10.0, 15.0}}, false, 0};

    bool completed = false;
    for (int i = 0; i < 1000 && !completed; ++i) completed = step_agent_task(a, kDt, kSpeed, bounds).completed;
    DF_ASSERT(completed);
    DF_ASSERT(!a.task.has_value());
    DF_ASSERT(a.status == AgentStatus::Idle);
    DF_ASSERT(distance(a.position, {10.0, 15.0}) <= kPathWaypointEpsilon + 1e-9);

    const Vec2 rest = a.position;
    for (int i = 0; i < 20; ++i) (void)step_agent_task(a, kDt, kSpeed, bounds);
    DF_ASSERT(a.position == rest);
  }

  // HOLD does not move.
  {
    Agent a = make_agent({50.0, 50.0});
    a.task = HoldTask{"h", "D1"};
    for (int i = 0; i < 10; ++i) (void)step_agent_task(a, kDt, kSpeed, bounds);
    DF_ASSERT(a.position == Vec2(50.0, 50.0));
    DF_ASSERT(a.status == AgentStatus::Holding);
    DF_ASSERT(a.task.has_value());
  }

  // A corrupt task degrades to holding in place.
  {
    Agent a = make_agent({20.0, 20.0});
    a.task = PathTask{"bad", {{30.0, 30.0}}, true, 7};
    const auto res = step_agent_task(a, kDt, kSpeed, bounds);
    DF_ASSERT(res.fault);
    DF_ASSERT(res.task_id == "bad");
    DF_ASSERT(res.fault_reason.find("cursor") != std::string::npos);
    DF_ASSERT(a.position == Vec2(20.0, 20.0));
    DF_ASSERT(a.status == AgentStatus::Holding);
    DF_ASSERT(a.task.has_value());

    DF_ASSERT(check_task_integrity(PathTask{"empty", {}, true, 0}).has_value());
    DF_ASSERT(check_task_integrity(GotoTask{"eps", {1.0, 1.0}, 0.0}).has_value());
    DF_ASSERT(!check_task_integrity(GotoTask{"ok", {1.0, 1.0}, 2.0}).has_value());
  }

  // No task: no motion, IDLE.
  {
    Agent a = make_agent({1.0, 2.0});
    a.status = AgentStatus::Navigating;
    const auto res = step_agent_task(a, kDt, kSpeed, bounds);
    DF_ASSERT(!res.completed && !res.fault);
    DF_ASSERT(a.status == AgentStatus::Idle);
    DF_ASSERT(a.position == Vec2(1.0, 2.0));
  }

  DF_ASSERT(status_for_task(HoldTask{}) == AgentStatus::Holding);
  DF_ASSERT(status_for_task(GotoTask{}) == AgentStatus::Navigating);

  return 0;
}
