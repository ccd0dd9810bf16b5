#include "dronefleet/core/world.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>

#include "dronefleet/util/sorted_keys.h"

namespace dronefleet {

Vec2 WorldBounds::clamp(const Vec2& p) const {
  return {std::clamp(p.x, 0.0, width), std::clamp(p.y, 0.0, height)};
}

std::vector<std::string> validate_world(const World& world) {
  std::vector<std::string> errors;

  if (!(world.bounds.width > 0.0) || !(world.bounds.height > 0.0) || !std::isfinite(world.bounds.width) ||
      !std::isfinite(world.bounds.height)) {
    errors.push_back("World bounds must be positive and finite");
  }

  if (world.agents.empty()) errors.push_back("World has no drones");

  for (const auto& id : util::sorted_keys(world.agents)) {
    const Agent& a = world.agents.at(id);
    if (id.empty()) errors.push_back("Drone with empty id");
    if (a.id != id) errors.push_back("Drone key '" + id + "' does not match its id '" + a.id + "'");
    if (!a.position.is_finite() || !world.bounds.contains(a.position)) {
      errors.push_back("Drone " + id + " starts outside the world bounds");
    }
    if (!(a.battery >= 0.0 && a.battery <= kBatteryCapacity)) {
      errors.push_back("Drone " + id + " battery must be within [0, 100]");
    }
  }

  std::unordered_set<std::string> zone_ids;
  for (const Zone& z : world.zones) {
    if (z.id.empty()) errors.push_back("Zone with empty id");
    if (!zone_ids.insert(z.id).second) errors.push_back("Duplicate zone id: " + z.id);
    if (!z.rect.is_valid()) errors.push_back("Zone " + z.id + " has an inverted rectangle");
    const bool scores_ok = z.base_severity >= 0.0 && z.base_severity <= 1.0 && z.base_confidence >= 0.0 &&
                           z.base_confidence <= 1.0;
    if (!scores_ok) errors.push_back("Zone " + z.id + " base severity/confidence must be within [0, 1]");
    if (!(z.cooldown_s >= 0.0) || !std::isfinite(z.cooldown_s)) {
      errors.push_back("Zone " + z.id + " cooldown_s must be >= 0");
    }
  }

  return errors;
}

} // namespace dronefleet
