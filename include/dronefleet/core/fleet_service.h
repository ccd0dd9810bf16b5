#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "dronefleet/core/errors.h"
#include "dronefleet/core/simulation.h"

namespace dronefleet {

struct AssignRequest {
  std::string drone_id;
  Task task;
};

// Per-item outcome of an assignment.
struct AssignResult {
  std::string drone_id;
  bool ok{false};

  // Normalized task when ok.
  std::optional<Task> assigned;

  // Set when !ok.
  ErrorKind error_kind{ErrorKind::InvalidTask};
  std::string error;
};

// Tick counter and world time read together.
struct ClockReading {
  std::int64_t tick{0};
  double time_s{0.0};
};

// Thread-safe command surface over a Simulation.
//
// A single mutex serializes every tick, every assignment (each batch item on
// its own) and every snapshot copy, so callers never observe a half-applied
// tick or a half-replaced task.
class FleetService {
 public:
  // Throws std::runtime_error if the world or config is invalid.
  FleetService(World world, SimConfig cfg);

  FleetService(const FleetService&) = delete;
  FleetService& operator=(const FleetService&) = delete;

  // Throws CommandError (NotFound / InvalidTask). The world is unchanged on
  // failure.
  Task assign_task(const std::string& drone_id, Task task);

  // Same as assign_task() but reports failure in the result instead of
  // throwing.
  AssignResult try_assign(const std::string& drone_id, Task task);

  // Applies items in order, each atomically and independently. The result
  // list is parallel to `items`; one failure never affects the others.
  std::vector<AssignResult> assign_batch(const std::vector<AssignRequest>& items);

  // Throws CommandError(NotFound) for an unknown drone.
  std::optional<Task> cancel_task(const std::string& drone_id);

  // Snapshot with the configured snapshot_event_limit.
  WorldSnapshot snapshot() const;
  WorldSnapshot snapshot(std::size_t event_limit) const;

  void tick();
  void step(int ticks);

  std::int64_t tick_count() const;
  double time_s() const;
  ClockReading clock() const;

  bool has_agent(const std::string& drone_id) const;

  // Immutable after construction.
  const SimConfig& cfg() const { return cfg_; }

  // Run `fn` with the lock held. For read-only inspection that a snapshot
  // would copy too much for (tests, diagnostics).
  void with_simulation(const std::function<void(const Simulation&)>& fn) const;

 private:
  const SimConfig cfg_;
  mutable std::mutex mu_;
  Simulation sim_;
};

} // namespace dronefleet
