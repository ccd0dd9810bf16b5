#include "dronefleet/core/zone_detector.h"

#include <algorithm>
#include <cmath>

#include "dronefleet/core/enum_strings.h"
#include "dronefleet/core/world.h"
#include "dronefleet/util/sorted_keys.h"

namespace dronefleet {
namespace {

double clamp01(double v) { return std::clamp(v, 0.0, 1.0); }

double axis_offset(double v, double lo, double hi) {
  const double half = (hi - lo) * 0.5;
  if (!(half > 0.0)) return 0.0;
  return std::abs(v - (lo + hi) * 0.5) / half;
}

WorldEvent make_zone_event(const Agent& agent, const Zone& zone, double now, bool entering) {
  WorldEvent ev;
  ev.ts = now;
  ev.type = event_type_for_zone(zone.type);
  ev.agent_id = agent.id;
  ev.position = agent.position;

  const double p = zone_proximity(zone.rect, agent.position);
  ev.severity = clamp01(zone.base_severity + 0.25 * p);
  ev.confidence = clamp01(zone.base_confidence + 0.20 * p);

  const std::string label = zone.name.empty() ? zone.id : zone.name;
  switch (zone.type) {
    case ZoneType::FireRisk:
      ev.message = "Possible fire detected near " + label;
      break;
    case ZoneType::NoFly:
      ev.message = agent.id + " entered no-fly zone " + label;
      break;
    case ZoneType::SignalLoss:
      ev.message = agent.id + " lost signal in " + label;
      break;
    case ZoneType::Info:
      ev.message = agent.id + " entered " + label;
      break;
  }
  if (!entering) ev.message += " (still inside)";

  ev.payload["zone_id"] = zone.id;
  ev.payload["zone_name"] = zone.name;
  ev.payload["zone_type"] = zone_type_to_string(zone.type);
  ev.payload["entering"] = entering;
  ev.payload["proximity"] = p;
  return ev;
}

} // namespace

double zone_proximity(const Rect& rect, const Vec2& p) {
  if (!rect.contains(p)) return 0.0;
  const double off = std::max(axis_offset(p.x, rect.xmin, rect.xmax), axis_offset(p.y, rect.ymin, rect.ymax));
  return 1.0 - std::min(1.0, off);
}

EventType event_type_for_zone(ZoneType type) {
  switch (type) {
    case ZoneType::FireRisk: return EventType::FireDetected;
    case ZoneType::NoFly: return EventType::NoFlyViolation;
    case ZoneType::SignalLoss: return EventType::SignalLoss;
    case ZoneType::Info: return EventType::EnterZone;
  }
  return EventType::EnterZone;
}

bool ZoneDetector::is_inside(const std::string& agent_id, const std::string& zone_id) const {
  auto it = pairs_.find(pair_key(agent_id, zone_id));
  return it != pairs_.end() && it->second.inside;
}

std::vector<WorldEvent> ZoneDetector::detect(const World& world) {
  std::vector<WorldEvent> out;
  const double now = world.time_s;

  for (const auto& agent_id : util::sorted_keys(world.agents)) {
    const Agent& agent = world.agents.at(agent_id);
    for (const Zone& zone : world.zones) {
      const bool inside = zone.rect.contains(agent.position);
      const std::string key = pair_key(agent_id, zone.id);

      if (!inside) {
        auto it = pairs_.find(key);
        if (it != pairs_.end()) it->second.inside = false;
        continue;
      }

      PairState& st = pairs_[key];
      const bool entering = !st.inside;
      st.inside = true;

      bool fire = entering;
      if (!fire && zone.trigger == ZoneTrigger::OnStay) fire = (now - st.last_fired_ts) >= zone.cooldown_s;
      if (!fire) continue;

      st.last_fired_ts = now;
      out.push_back(make_zone_event(agent, zone, now, entering));
    }
  }
  return out;
}

} // namespace dronefleet
