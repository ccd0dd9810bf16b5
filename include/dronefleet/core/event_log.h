#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

#include "dronefleet/core/entities.h"

namespace dronefleet {

// Bounded, time-ordered log of world events.
//
// Holds at most `capacity` events; pushing onto a full log evicts the oldest.
// When max_age_s > 0, evict_expired() also drops events older than that
// window. Events are never modified once logged.
class EventLog {
 public:
  explicit EventLog(std::size_t capacity = 200, double max_age_s = 0.0);

  // Assigns the next sequence number and appends. Events must arrive in
  // non-decreasing ts order (the clock guarantees this).
  const WorldEvent& push(WorldEvent ev);

  // Drop events with ts < now - max_age_s. No-op when the window is disabled.
  void evict_expired(double now);

  // Up to `limit` most recent events with ts <= up_to_ts, oldest first.
  // limit == 0 returns every retained event.
  std::vector<WorldEvent> recent(std::size_t limit, double up_to_ts) const;

  std::size_t size() const { return events_.size(); }
  bool empty() const { return events_.empty(); }
  std::size_t capacity() const { return capacity_; }
  double max_age_s() const { return max_age_s_; }
  std::uint64_t evicted_count() const { return evicted_; }

  std::deque<WorldEvent>::const_iterator begin() const { return events_.begin(); }
  std::deque<WorldEvent>::const_iterator end() const { return events_.end(); }

 private:
  std::deque<WorldEvent> events_;
  std::size_t capacity_;
  double max_age_s_;
  std::uint64_t next_seq_{1};
  std::uint64_t evicted_{0};
};

} // namespace dronefleet
