#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "dronefleet/util/json.h"

namespace dronefleet {

struct SimConfig {
  // Simulated seconds per tick.
  double tick_seconds{0.2};

  // Drone ground speed in world units per simulated second. Every drone moves
  // at this speed regardless of kind.
  double agent_speed{1.6};

  // Battery percent drained per simulated second while NAVIGATING or HOLDING.
  // Batteries never recharge.
  double battery_drain_per_s{0.02};

  // Crossing this level records a single BATTERY_LOW event for the drone.
  double battery_low_threshold{20.0};

  // Event log retention. A full log evicts its oldest event first.
  // event_max_age_s > 0 additionally drops events older than that window.
  std::size_t event_log_capacity{200};
  double event_max_age_s{0.0};

  // Most recent events included in a state snapshot (0 = all retained).
  std::size_t snapshot_event_limit{50};

  // Clock runner pacing: simulated seconds per wall-clock second.
  double time_scale{1.0};
};

// Returns human-readable problems; empty when the config is usable.
std::vector<std::string> validate_sim_config(const SimConfig& cfg);

// Keys mirror the field names. Missing keys keep their defaults; unknown keys
// and wrongly typed values throw std::runtime_error.
SimConfig sim_config_from_json(const json::Value& v);
json::Value sim_config_to_json(const SimConfig& cfg);

// Reads, parses and validates. Throws std::runtime_error listing every problem.
SimConfig load_sim_config_from_file(const std::string& path);

} // namespace dronefleet
