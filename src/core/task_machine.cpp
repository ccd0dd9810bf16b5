#include "dronefleet/core/task_machine.h"

#include <algorithm>
#include <cmath>
#include <type_traits>

#include "dronefleet/core/world.h"

namespace dronefleet {
namespace {

std::optional<std::string> check_point(const Vec2& p, const char* what) {
  if (!p.is_finite()) return std::string(what) + " has non-finite coordinates";
  return std::nullopt;
}

void finish_task(Agent& agent, TaskStepResult& res) {
  res.completed = true;
  res.task_id = task_id(*agent.task);
  agent.task.reset();
  agent.status = AgentStatus::Idle;
}

// Returns true when the task completed.
bool step_goto(Agent& agent, const GotoTask& t, double max_step) {
  if (distance(agent.position, t.target) <= t.arrive_eps) return true;
  agent.position = move_towards(agent.position, t.target, max_step);
  agent.status = AgentStatus::Navigating;
  return distance(agent.position, t.target) <= t.arrive_eps;
}

// Moves toward the cursor waypoint, advancing the cursor at most once.
// Returns true when a non-looping path passed its last waypoint.
bool step_path(Agent& agent, PathTask& t, double max_step) {
  const int n = static_cast<int>(t.waypoints.size());

  auto advance = [&]() -> bool {
    if (t.cursor + 1 < n) {
      ++t.cursor;
      return false;
    }
    if (!t.loop) return true;
    t.cursor = 0;
    return false;
  };

  bool advanced = false;
  if (distance(agent.position, t.waypoints[static_cast<std::size_t>(t.cursor)]) <= kPathWaypointEpsilon) {
    if (advance()) return true;
    advanced = true;
  }

  agent.position = move_towards(agent.position, t.waypoints[static_cast<std::size_t>(t.cursor)], max_step);
  agent.status = AgentStatus::Navigating;

  if (!advanced &&
      distance(agent.position, t.waypoints[static_cast<std::size_t>(t.cursor)]) <= kPathWaypointEpsilon) {
    return advance();
  }
  return false;
}

} // namespace

std::optional<std::string> check_task_integrity(const Task& task) {
  return std::visit(
      [](const auto& t) -> std::optional<std::string> {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, GotoTask>) {
          if (auto err = check_point(t.target, "GOTO target")) return err;
          if (!std::isfinite(t.arrive_eps) || !(t.arrive_eps > 0.0)) return std::string("arrive_eps must be > 0");
          return std::nullopt;
        } else if constexpr (std::is_same_v<T, PathTask>) {
          if (t.waypoints.empty()) return std::string("PATH has no waypoints");
          if (t.cursor < 0 || t.cursor >= static_cast<int>(t.waypoints.size())) {
            return "PATH cursor " + std::to_string(t.cursor) + " out of range";
          }
          for (const Vec2& w : t.waypoints) {
            if (auto err = check_point(w, "PATH waypoint")) return err;
          }
          return std::nullopt;
        } else {
          return std::nullopt;
        }
      },
      task);
}

AgentStatus status_for_task(const Task& task) {
  return task_kind(task) == TaskKind::Hold ? AgentStatus::Holding : AgentStatus::Navigating;
}

TaskStepResult step_agent_task(Agent& agent, double dt, double speed, const WorldBounds& bounds) {
  TaskStepResult res;
  if (!agent.task) {
    agent.status = AgentStatus::Idle;
    return res;
  }

  if (auto problem = check_task_integrity(*agent.task)) {
    res.fault = true;
    res.fault_reason = *problem;
    res.task_id = task_id(*agent.task);
    agent.status = AgentStatus::Holding;
    return res;
  }

  const double max_step = std::max(0.0, speed * dt);

  const bool done = std::visit(
      [&](auto& t) -> bool {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, GotoTask>) {
          return step_goto(agent, t, max_step);
        } else if constexpr (std::is_same_v<T, PathTask>) {
          return step_path(agent, t, max_step);
        } else {
          agent.status = AgentStatus::Holding;
          return false;
        }
      },
      *agent.task);

  agent.position = bounds.clamp(agent.position);
  if (done) finish_task(agent, res);
  return res;
}

} // namespace dronefleet
