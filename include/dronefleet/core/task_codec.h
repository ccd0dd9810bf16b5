#pragma once

#include "dronefleet/core/tasks.h"
#include "dronefleet/util/json.h"

namespace dronefleet {

// Wire form of a task:
//   {"type":"GOTO", "target":{"x":..,"y":..}, "arrive_eps":2.0, "id":"..."}
//   {"type":"PATH", "waypoints":[{"x":..,"y":..}, ...], "loop":true, "id":"..."}
//   {"type":"HOLD", "drone_id":"D1", "id":"..."}
//
// "type" is case-insensitive. Optional fields take their defaults; an absent
// id is left empty for the assigner to fill in. Structural problems (missing
// or mistyped fields, unknown type, empty waypoint list) throw CommandError
// with ErrorKind::InvalidTask. Range checks against the world happen at
// assignment.
Task task_from_json(const json::Value& v);

// Inverse of task_from_json. PATH tasks also report their live "cursor".
json::Value task_to_json(const Task& task);

json::Value vec2_to_json(const Vec2& p);

} // namespace dronefleet
