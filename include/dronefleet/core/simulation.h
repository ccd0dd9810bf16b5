#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "dronefleet/core/sim_config.h"
#include "dronefleet/core/world.h"
#include "dronefleet/core/zone_detector.h"

namespace dronefleet {

// Copy of the world taken between ticks. Agents are sorted by id.
struct WorldSnapshot {
  std::int64_t tick{0};
  double time_s{0.0};
  WorldBounds bounds;
  std::vector<Agent> agents;
  std::vector<Zone> zones;
  std::vector<WorldEvent> recent_events;
};

// Assignment-time rules for a task bound for `agent_id`: finite coordinates
// inside `bounds`, arrive_eps > 0, at least one waypoint, and a HOLD that
// names the same drone. Returns the violated rule, or nullopt.
std::optional<std::string> find_task_violation(const Task& task, const std::string& agent_id,
                                               const WorldBounds& bounds);

// Owns the World and advances it one fixed step at a time.
//
// Not thread-safe: FleetService wraps it with the lock that concurrent
// callers need.
class Simulation {
 public:
  // Throws std::runtime_error if the config or the world fails validation.
  Simulation(World world, SimConfig cfg);

  const SimConfig& cfg() const { return cfg_; }

  const World& world() const { return world_; }

  const ZoneDetector& detector() const { return detector_; }

  // One tick, in order: task state machine for every agent (id order), battery
  // drain, zone detection, then world time advances by cfg().tick_seconds.
  // Events produced by the tick are stamped with the time at its start.
  void tick();

  // Run `ticks` ticks back to back. Non-positive counts do nothing.
  void step(int ticks);

  // Replace the agent's task with `task`.
  //
  // Throws CommandError(NotFound) for an unknown agent and
  // CommandError(InvalidTask) when find_task_violation() objects. On success
  // returns the task as stored: auto id filled in, PATH cursor reset to 0.
  // Nothing is modified when an exception is thrown.
  Task assign_task(const std::string& agent_id, Task task);

  // Clear the agent's task and return it to IDLE. Returns the task that was
  // cleared, if any. Throws CommandError(NotFound) for an unknown agent.
  std::optional<Task> cancel_task(const std::string& agent_id);

  // event_limit == 0 includes every retained event.
  WorldSnapshot snapshot(std::size_t event_limit) const;

 private:
  void drain_battery(Agent& agent, double dt);
  void record_event(WorldEvent ev);

  SimConfig cfg_;
  World world_;
  ZoneDetector detector_;
};

} // namespace dronefleet
