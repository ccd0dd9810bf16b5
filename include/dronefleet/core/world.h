#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "dronefleet/core/entities.h"
#include "dronefleet/core/event_log.h"

namespace dronefleet {

// The map is [0, width] x [0, height]. Drone positions are clamped into it
// every tick and task coordinates must lie inside it.
struct WorldBounds {
  double width{100.0};
  double height{100.0};

  bool contains(const Vec2& p) const { return p.x >= 0.0 && p.x <= width && p.y >= 0.0 && p.y <= height; }
  Vec2 clamp(const Vec2& p) const;
};

// Canonical simulation state. Owned by a Simulation; every other component
// reaches it through that owner.
struct World {
  // Number of completed ticks. time_s is always tick * dt so repeated
  // addition never drifts.
  std::int64_t tick{0};
  double time_s{0.0};

  WorldBounds bounds;

  std::unordered_map<std::string, Agent> agents;
  std::vector<Zone> zones;

  EventLog events;
};

template <typename Map>
auto* find_ptr(Map& m, const typename Map::key_type& k) {
  auto it = m.find(k);
  if (it == m.end()) return static_cast<decltype(&it->second)>(nullptr);
  return &it->second;
}

template <typename Map>
const auto* find_ptr(const Map& m, const typename Map::key_type& k) {
  auto it = m.find(k);
  if (it == m.end()) return static_cast<const decltype(&it->second)>(nullptr);
  return &it->second;
}

// Structural checks for a freshly built world (scenario output). Returns an
// empty list when the world is usable.
std::vector<std::string> validate_world(const World& world);

} // namespace dronefleet
