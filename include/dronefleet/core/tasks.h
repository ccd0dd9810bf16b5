#pragma once

#include <string>
#include <variant>
#include <vector>

#include "dronefleet/core/vec2.h"

namespace dronefleet {

enum class TaskKind { Goto, Path, Hold };

// Default GOTO arrival radius when a request does not specify one.
inline constexpr double kDefaultArriveEps = 2.0;

// Arrival radius used by the path follower for every waypoint. Not configurable
// per task; GOTO's arrive_eps does not apply to paths.
inline constexpr double kPathWaypointEpsilon = 0.5;

// Fly to a point and stop. Completes once within arrive_eps of the target.
struct GotoTask {
  std::string id;
  Vec2 target;
  double arrive_eps{kDefaultArriveEps};
};

// Follow waypoints in order.
//
// cursor is the index of the waypoint currently being approached. With loop
// enabled the cursor wraps to 0 after the last waypoint and the task never
// completes on its own.
struct PathTask {
  std::string id;
  std::vector<Vec2> waypoints;
  bool loop{true};
  int cursor{0};
};

// Stay in place. agent_id names the drone the hold was issued for and must
// match the drone it is assigned to.
struct HoldTask {
  std::string id;
  std::string agent_id;
};

using Task = std::variant<GotoTask, PathTask, HoldTask>;

TaskKind task_kind(const Task& task);
const std::string& task_id(const Task& task);

// "goto_{int(t*10)}", "path_{int(t*10)}" or "hold_{int(t*10)}" for world time t.
std::string auto_task_id(TaskKind kind, double world_time);

// Short human-readable description, e.g. "GOTO (10, 20) eps=2".
std::string task_to_string(const Task& task);

} // namespace dronefleet
