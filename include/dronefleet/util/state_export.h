#pragma once

#include <string>
#include <vector>

#include "dronefleet/core/simulation.h"
#include "dronefleet/util/json.h"

namespace dronefleet {

// JSON shapes of the state query.
//
// Drone: {id, kind, pos{x,y}, home{x,y}, status, battery, task|null}
// Zone:  {id, name, type, rect{xmin,xmax,ymin,ymax}, base_severity, base_confidence}
// Event: {seq, ts, type, drone_id, pos{x,y}, message, payload, severity, confidence}
json::Value agent_to_json(const Agent& agent);
json::Value zone_to_json(const Zone& zone);
json::Value event_to_json(const WorldEvent& ev);

// {ts, tick, bounds{width,height}, drones[], zones[], recent_events[]}
json::Value snapshot_to_json(const WorldSnapshot& snap);

// One compact JSON object per line, in the order provided. Ends with a
// trailing newline when non-empty.
std::string events_to_jsonl(const std::vector<WorldEvent>& events);

} // namespace dronefleet
