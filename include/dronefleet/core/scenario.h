#pragma once

#include <cstdint>
#include <string>

#include "dronefleet/core/world.h"
#include "dronefleet/util/json.h"

namespace dronefleet {

// Standard roster on a 100 x 100 map: scouts D1-D4 parked 5 units in from
// each corner and firefighters FD1-FD4 docked along the bottom edge near the
// centre. Two or three FIRE_RISK zones (sides 6-12, at least 8 units from the
// edges) are placed from `seed`; the same seed always gives the same map.
World make_default_scenario(std::uint32_t seed);

// Standard roster with a single fixed fire zone "z_fire" covering
// (42..58, 42..58). Used by the demo command script and the tests.
World make_demo_scenario();

// Scenario file:
//   {
//     "bounds": {"width": 100, "height": 100},
//     "drones": [{"id": "D1", "kind": "scout", "pos": {"x": 5, "y": 5},
//                 "home": {...}, "battery": 100}],
//     "zones":  [{"id": "z1", "name": "...", "type": "FIRE_RISK",
//                 "rect": {"xmin": .., "xmax": .., "ymin": .., "ymax": ..},
//                 "base_severity": 0.5, "base_confidence": 0.7}]
//   }
// "bounds", "kind", "home" (defaults to pos), "battery", "name" and the base
// scores are optional. Throws std::runtime_error on malformed input.
World scenario_from_json(const json::Value& v);
World load_scenario_from_file(const std::string& path);

json::Value scenario_to_json(const World& world);

} // namespace dronefleet
