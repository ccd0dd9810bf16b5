#include "dronefleet/core/event_log.h"

#include <algorithm>
#include <iterator>
#include <utility>

namespace dronefleet {

EventLog::EventLog(std::size_t capacity, double max_age_s)
    : capacity_(std::max<std::size_t>(capacity, 1)), max_age_s_(max_age_s) {}

const WorldEvent& EventLog::push(WorldEvent ev) {
  ev.seq = next_seq_++;
  while (events_.size() >= capacity_) {
    events_.pop_front();
    ++evicted_;
  }
  events_.push_back(std::move(ev));
  return events_.back();
}

void EventLog::evict_expired(double now) {
  if (max_age_s_ <= 0.0) return;
  const double cutoff = now - max_age_s_;
  while (!events_.empty() && events_.front().ts < cutoff) {
    events_.pop_front();
    ++evicted_;
  }
}

std::vector<WorldEvent> EventLog::recent(std::size_t limit, double up_to_ts) const {
  // Walk back from the newest event; the log is sorted by ts.
  auto stop = events_.end();
  while (stop != events_.begin() && std::prev(stop)->ts > up_to_ts) --stop;

  auto first = events_.begin();
  const auto available = static_cast<std::size_t>(std::distance(first, stop));
  if (limit > 0 && available > limit) first = stop - static_cast<std::ptrdiff_t>(limit);
  return std::vector<WorldEvent>(first, stop);
}

} // namespace dronefleet
