#include "dronefleet/core/task_codec.h"

#include <type_traits>

#include "dronefleet/core/enum_strings.h"
#include "dronefleet/core/errors.h"

namespace dronefleet {
namespace {

double read_coord(const json::Object& o, const char* key, const std::string& where) {
  auto it = o.find(key);
  if (it == o.end()) throw invalid_task_error(where + " is missing '" + key + "'");
  const double* d = it->second.as_number();
  if (!d) throw invalid_task_error(where + "." + key + " must be a number");
  return *d;
}

Vec2 read_point(const json::Value& v, const std::string& where) {
  const json::Object* o = v.as_object();
  if (!o) throw invalid_task_error(where + " must be an object with x and y");
  return {read_coord(*o, "x", where), read_coord(*o, "y", where)};
}

std::string read_optional_string(const json::Object& o, const char* key) {
  auto it = o.find(key);
  if (it == o.end() || it->second.is_null()) return {};
  const std::string* s = it->second.as_string();
  if (!s) throw invalid_task_error(std::string("task.") + key + " must be a string");
  return *s;
}

} // namespace

Task task_from_json(const json::Value& v) {
  const json::Object* o = v.as_object();
  if (!o) throw invalid_task_error(std::string("task must be an object (got ") + json::type_name(v) + ")");

  const std::string type_name = read_optional_string(*o, "type");
  if (type_name.empty()) throw invalid_task_error("task.type is required");
  TaskKind kind{};
  if (!task_kind_from_string(type_name, kind)) throw invalid_task_error("Unsupported task type: " + type_name);

  const std::string id = read_optional_string(*o, "id");

  switch (kind) {
    case TaskKind::Goto: {
      auto tgt = o->find("target");
      if (tgt == o->end() || tgt->second.is_null()) throw invalid_task_error("GOTO requires target");
      GotoTask t;
      t.id = id;
      t.target = read_point(tgt->second, "target");
      if (auto eps = o->find("arrive_eps"); eps != o->end() && !eps->second.is_null()) {
        const double* d = eps->second.as_number();
        if (!d) throw invalid_task_error("arrive_eps must be a number");
        t.arrive_eps = *d;
      }
      return t;
    }
    case TaskKind::Path: {
      auto wps = o->find("waypoints");
      if (wps == o->end() || !wps->second.is_array()) throw invalid_task_error("PATH requires a waypoints array");
      PathTask t;
      t.id = id;
      const json::Array& arr = wps->second.array();
      if (arr.empty()) throw invalid_task_error("PATH waypoints must not be empty");
      t.waypoints.reserve(arr.size());
      for (std::size_t i = 0; i < arr.size(); ++i) {
        t.waypoints.push_back(read_point(arr[i], "waypoints[" + std::to_string(i) + "]"));
      }
      if (auto loop = o->find("loop"); loop != o->end() && !loop->second.is_null()) {
        const bool* b = loop->second.as_bool();
        if (!b) throw invalid_task_error("loop must be a boolean");
        t.loop = *b;
      }
      return t;
    }
    case TaskKind::Hold: {
      HoldTask t;
      t.id = id;
      t.agent_id = read_optional_string(*o, "drone_id");
      if (t.agent_id.empty()) throw invalid_task_error("HOLD requires drone_id in the task payload");
      return t;
    }
  }
  throw invalid_task_error("Unsupported task type: " + type_name);
}

json::Value vec2_to_json(const Vec2& p) {
  json::Object o;
  o["x"] = p.x;
  o["y"] = p.y;
  return o;
}

json::Value task_to_json(const Task& task) {
  json::Object o;
  o["type"] = task_kind_to_string(task_kind(task));
  o["id"] = task_id(task);
  std::visit(
      [&](const auto& t) {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, GotoTask>) {
          o["target"] = vec2_to_json(t.target);
          o["arrive_eps"] = t.arrive_eps;
        } else if constexpr (std::is_same_v<T, PathTask>) {
          json::Array wps;
          wps.reserve(t.waypoints.size());
          for (const Vec2& w : t.waypoints) wps.push_back(vec2_to_json(w));
          o["waypoints"] = std::move(wps);
          o["loop"] = t.loop;
          o["cursor"] = t.cursor;
        } else {
          o["drone_id"] = t.agent_id;
        }
      },
      task);
  return o;
}

} // namespace dronefleet
