#pragma once

#include <optional>
#include <string>

#include "dronefleet/core/entities.h"
#include "dronefleet/core/tasks.h"

namespace dronefleet {

struct WorldBounds;

// Outcome of advancing one agent's task by a single tick.
struct TaskStepResult {
  // The task finished this tick (GOTO arrived, non-looping PATH passed its
  // last waypoint). The agent is IDLE and its task slot is empty.
  bool completed{false};

  // The task was unusable and the agent was held in place instead.
  bool fault{false};
  std::string fault_reason;

  // Id of the task that completed or faulted.
  std::string task_id;
};

// Returns a description of the first problem that makes `task` impossible to
// execute, or nullopt when it is well formed. Checks only the task's own data
// (coordinates, epsilon, waypoint cursor); placement against the world bounds
// is an assignment-time rule.
std::optional<std::string> check_task_integrity(const Task& task);

// Status an agent takes on while running `task`.
AgentStatus status_for_task(const Task& task);

// Advance `agent` by one tick of `dt` simulated seconds at `speed` units/s.
//
// An agent without a task does not move. A task that fails
// check_task_integrity() is treated as HOLD for this tick; the agent keeps
// the task so callers can report the fault. The resulting position is always
// clamped into `bounds`.
TaskStepResult step_agent_task(Agent& agent, double dt, double speed, const WorldBounds& bounds);

} // namespace dronefleet
