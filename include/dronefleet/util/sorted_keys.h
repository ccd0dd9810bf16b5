#pragma once

#include <algorithm>
#include <vector>

namespace dronefleet::util {

// Keyed containers in the world model are std::unordered_map. Anything that
// produces output (snapshots, CLI listings, the viewer) walks them through
// this so results do not depend on hash order.
template <typename Map>
inline std::vector<typename Map::key_type> sorted_keys(const Map& m) {
  std::vector<typename Map::key_type> keys;
  keys.reserve(m.size());
  for (const auto& kv : m) keys.push_back(kv.first);
  std::sort(keys.begin(), keys.end());
  return keys;
}

} // namespace dronefleet::util
