#include "dronefleet/core/simulation.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <type_traits>

#include "dronefleet/core/enum_strings.h"
#include "dronefleet/core/errors.h"
#include "dronefleet/core/task_machine.h"
#include "dronefleet/util/log.h"
#include "dronefleet/util/sorted_keys.h"
#include "dronefleet/util/strings.h"

namespace dronefleet {
namespace {

std::optional<std::string> check_placement(const Vec2& p, const WorldBounds& bounds, const std::string& what) {
  if (!p.is_finite()) return what + " must have finite coordinates";
  if (!bounds.contains(p)) {
    return what + " (" + format_fixed(p.x, 2) + ", " + format_fixed(p.y, 2) + ") is outside the world bounds";
  }
  return std::nullopt;
}

[[noreturn]] void throw_invalid(const std::string& where, const std::vector<std::string>& errors) {
  std::ostringstream ss;
  ss << where << ":";
  for (const auto& e : errors) ss << "\n  - " << e;
  throw std::runtime_error(ss.str());
}

} // namespace

std::optional<std::string> find_task_violation(const Task& task, const std::string& agent_id,
                                               const WorldBounds& bounds) {
  return std::visit(
      [&](const auto& t) -> std::optional<std::string> {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, GotoTask>) {
          if (auto err = check_placement(t.target, bounds, "GOTO target")) return err;
          if (!std::isfinite(t.arrive_eps) || !(t.arrive_eps > 0.0)) return std::string("arrive_eps must be > 0");
          return std::nullopt;
        } else if constexpr (std::is_same_v<T, PathTask>) {
          if (t.waypoints.empty()) return std::string("PATH waypoints must not be empty");
          for (std::size_t i = 0; i < t.waypoints.size(); ++i) {
            if (auto err = check_placement(t.waypoints[i], bounds, "waypoints[" + std::to_string(i) + "]")) {
              return err;
            }
          }
          return std::nullopt;
        } else {
          if (t.agent_id.empty()) return std::string("HOLD requires drone_id in the task payload");
          if (t.agent_id != agent_id) {
            return "HOLD drone_id=" + t.agent_id + " does not match request drone_id=" + agent_id;
          }
          return std::nullopt;
        }
      },
      task);
}

Simulation::Simulation(World world, SimConfig cfg) : cfg_(std::move(cfg)), world_(std::move(world)) {
  if (auto errors = validate_sim_config(cfg_); !errors.empty()) throw_invalid("Invalid simulation config", errors);
  if (auto errors = validate_world(world_); !errors.empty()) throw_invalid("Invalid world", errors);

  // Re-home any pre-seeded events into a log sized by the config.
  EventLog log(cfg_.event_log_capacity, cfg_.event_max_age_s);
  for (const WorldEvent& ev : world_.events) log.push(ev);
  world_.events = std::move(log);

  world_.time_s = static_cast<double>(world_.tick) * cfg_.tick_seconds;
}

void Simulation::tick() {
  const double dt = cfg_.tick_seconds;
  const double now = world_.time_s;

  // (1) Fixed visiting order for this tick.
  const auto ids = util::sorted_keys(world_.agents);

  // (2) Task state machine.
  for (const auto& id : ids) {
    Agent& agent = world_.agents.at(id);
    const TaskStepResult res = step_agent_task(agent, dt, cfg_.agent_speed, world_.bounds);

    if (res.completed) {
      log::debug("Drone " + id + " completed task " + res.task_id);
    }
    if (res.fault && !agent.task_fault_reported) {
      agent.task_fault_reported = true;
      log::warn("Drone " + id + " task " + res.task_id + " is corrupt (" + res.fault_reason + "); holding");

      WorldEvent ev;
      ev.ts = now;
      ev.type = EventType::TaskFault;
      ev.agent_id = id;
      ev.position = agent.position;
      ev.message = "Task " + res.task_id + " could not be executed; holding position";
      ev.payload["task_id"] = res.task_id;
      ev.payload["reason"] = res.fault_reason;
      ev.severity = 0.3;
      ev.confidence = 1.0;
      record_event(std::move(ev));
    }
  }

  // (3) Battery.
  for (const auto& id : ids) drain_battery(world_.agents.at(id), dt);

  // (4) Zone detection over the updated positions.
  for (WorldEvent& ev : detector_.detect(world_)) {
    log::debug(std::string(event_type_to_string(ev.type)) + " " + ev.agent_id + ": " + ev.message);
    record_event(std::move(ev));
  }

  // (5) Advance time. Derived from the tick count so it never accumulates error.
  ++world_.tick;
  world_.time_s = static_cast<double>(world_.tick) * dt;
  world_.events.evict_expired(world_.time_s);
}

void Simulation::step(int ticks) {
  for (int i = 0; i < ticks; ++i) tick();
}

void Simulation::drain_battery(Agent& agent, double dt) {
  if (agent.status != AgentStatus::Navigating && agent.status != AgentStatus::Holding) return;

  agent.battery = std::max(0.0, agent.battery - cfg_.battery_drain_per_s * dt);

  if (!agent.battery_low && agent.battery <= cfg_.battery_low_threshold) {
    agent.battery_low = true;

    WorldEvent ev;
    ev.ts = world_.time_s;
    ev.type = EventType::BatteryLow;
    ev.agent_id = agent.id;
    ev.position = agent.position;
    ev.message = "Battery low (" + format_fixed(agent.battery, 1) + "%)";
    ev.payload["battery"] = agent.battery;
    ev.payload["threshold"] = cfg_.battery_low_threshold;
    ev.severity = 0.6;
    ev.confidence = 1.0;
    record_event(std::move(ev));
  }
}

void Simulation::record_event(WorldEvent ev) {
  world_.events.push(std::move(ev));
}

Task Simulation::assign_task(const std::string& agent_id, Task task) {
  Agent* agent = find_ptr(world_.agents, agent_id);
  if (!agent) throw unknown_drone_error(agent_id);

  if (auto violation = find_task_violation(task, agent_id, world_.bounds)) throw invalid_task_error(*violation);

  // Normalize before touching the agent so a failure above leaves it as it was.
  std::visit(
      [&](auto& t) {
        using T = std::decay_t<decltype(t)>;
        if (t.id.empty()) t.id = auto_task_id(task_kind(task), world_.time_s);
        if constexpr (std::is_same_v<T, PathTask>) t.cursor = 0;
      },
      task);

  agent->task = task;
  agent->status = status_for_task(task);
  agent->task_fault_reported = false;

  log::debug("Drone " + agent_id + " assigned " + task_to_string(task));
  return task;
}

std::optional<Task> Simulation::cancel_task(const std::string& agent_id) {
  Agent* agent = find_ptr(world_.agents, agent_id);
  if (!agent) throw unknown_drone_error(agent_id);

  std::optional<Task> prev = std::move(agent->task);
  agent->task.reset();
  agent->status = AgentStatus::Idle;
  agent->task_fault_reported = false;
  if (prev) log::debug("Drone " + agent_id + " task " + task_id(*prev) + " cancelled");
  return prev;
}

WorldSnapshot Simulation::snapshot(std::size_t event_limit) const {
  WorldSnapshot snap;
  snap.tick = world_.tick;
  snap.time_s = world_.time_s;
  snap.bounds = world_.bounds;

  snap.agents.reserve(world_.agents.size());
  for (const auto& id : util::sorted_keys(world_.agents)) snap.agents.push_back(world_.agents.at(id));

  snap.zones = world_.zones;
  snap.recent_events = world_.events.recent(event_limit, world_.time_s);
  return snap;
}

} // namespace dronefleet
