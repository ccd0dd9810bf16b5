#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "dronefleet/core/entities.h"

namespace dronefleet {

struct World;

// 0 on the rectangle's edge (or outside), 1 at its centre. Uses the larger of
// the normalized x / y offsets; an axis with zero extent contributes 0.
double zone_proximity(const Rect& rect, const Vec2& p);

EventType event_type_for_zone(ZoneType type);

// Point-in-rectangle detection with per (agent, zone) debounce.
//
// An agent entering a zone (or found inside on the first pass) produces one
// event. An OnEnter zone then stays quiet for the rest of the dwell; an OnStay
// zone fires again once its `cooldown_s` has passed since the last event.
// Leaving resets the pair so the next entry fires again.
class ZoneDetector {
 public:

  // Evaluate every agent against every zone at world.time_s. Returned events
  // carry ts / position / scores but no seq (the log assigns it). Agents are
  // visited in id order so output is deterministic.
  std::vector<WorldEvent> detect(const World& world);

  // Forget all dwell state (e.g. after the world is replaced).
  void reset() { pairs_.clear(); }

  // True while the detector believes `agent_id` is inside `zone_id`.
  bool is_inside(const std::string& agent_id, const std::string& zone_id) const;

 private:
  struct PairState {
    bool inside{false};
    double last_fired_ts{0.0};
  };

  static std::string pair_key(const std::string& agent_id, const std::string& zone_id) {
    return agent_id + '\x1f' + zone_id;
  }

  std::unordered_map<std::string, PairState> pairs_;
};

} // namespace dronefleet
