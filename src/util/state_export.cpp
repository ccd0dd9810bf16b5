#include "dronefleet/util/state_export.h"

#include "dronefleet/core/enum_strings.h"
#include "dronefleet/core/task_codec.h"

namespace dronefleet {

json::Value agent_to_json(const Agent& agent) {
  json::Object o;
  o["id"] = agent.id;
  o["kind"] = agent_kind_to_string(agent.kind);
  o["pos"] = vec2_to_json(agent.position);
  o["home"] = vec2_to_json(agent.home);
  o["status"] = agent_status_to_string(agent.status);
  o["battery"] = agent.battery;
  o["task"] = agent.task ? task_to_json(*agent.task) : json::Value(nullptr);
  return o;
}

json::Value zone_to_json(const Zone& zone) {
  json::Object rect;
  rect["xmin"] = zone.rect.xmin;
  rect["xmax"] = zone.rect.xmax;
  rect["ymin"] = zone.rect.ymin;
  rect["ymax"] = zone.rect.ymax;

  json::Object o;
  o["id"] = zone.id;
  o["name"] = zone.name;
  o["type"] = zone_type_to_string(zone.type);
  o["rect"] = std::move(rect);
  o["base_severity"] = zone.base_severity;
  o["base_confidence"] = zone.base_confidence;
  o["trigger"] = zone_trigger_to_string(zone.trigger);
  o["cooldown_s"] = zone.cooldown_s;
  return o;
}

json::Value event_to_json(const WorldEvent& ev) {
  json::Object o;
  o["seq"] = static_cast<double>(ev.seq);
  o["ts"] = ev.ts;
  o["type"] = event_type_to_string(ev.type);
  o["drone_id"] = ev.agent_id.empty() ? json::Value(nullptr) : json::Value(ev.agent_id);
  o["pos"] = vec2_to_json(ev.position);
  o["message"] = ev.message;
  o["payload"] = ev.payload;
  o["severity"] = ev.severity;
  o["confidence"] = ev.confidence;
  return o;
}

json::Value snapshot_to_json(const WorldSnapshot& snap) {
  json::Array drones;
  drones.reserve(snap.agents.size());
  for (const Agent& a : snap.agents) drones.push_back(agent_to_json(a));

  json::Array zones;
  zones.reserve(snap.zones.size());
  for (const Zone& z : snap.zones) zones.push_back(zone_to_json(z));

  json::Array events;
  events.reserve(snap.recent_events.size());
  for (const WorldEvent& ev : snap.recent_events) events.push_back(event_to_json(ev));

  json::Object bounds;
  bounds["width"] = snap.bounds.width;
  bounds["height"] = snap.bounds.height;

  json::Object o;
  o["ts"] = snap.time_s;
  o["tick"] = static_cast<double>(snap.tick);
  o["bounds"] = std::move(bounds);
  o["drones"] = std::move(drones);
  o["zones"] = std::move(zones);
  o["recent_events"] = std::move(events);
  return o;
}

std::string events_to_jsonl(const std::vector<WorldEvent>& events) {
  std::string out;
  for (const WorldEvent& ev : events) {
    out += json::stringify(event_to_json(ev), 0);
    out += '\n';
  }
  return out;
}

} // namespace dronefleet
