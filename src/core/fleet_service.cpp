#include "dronefleet/core/fleet_service.h"

#include "dronefleet/util/log.h"

namespace dronefleet {

FleetService::FleetService(World world, SimConfig cfg) : cfg_(cfg), sim_(std::move(world), std::move(cfg)) {}

Task FleetService::assign_task(const std::string& drone_id, Task task) {
  std::lock_guard<std::mutex> lock(mu_);
  return sim_.assign_task(drone_id, std::move(task));
}

AssignResult FleetService::try_assign(const std::string& drone_id, Task task) {
  AssignResult res;
  res.drone_id = drone_id;
  try {
    res.assigned = assign_task(drone_id, std::move(task));
    res.ok = true;
  } catch (const CommandError& e) {
    res.ok = false;
    res.error_kind = e.kind();
    res.error = e.what();
    log::info("Rejected task for " + drone_id + ": " + res.error);
  }
  return res;
}

std::vector<AssignResult> FleetService::assign_batch(const std::vector<AssignRequest>& items) {
  std::vector<AssignResult> out;
  out.reserve(items.size());
  for (const AssignRequest& item : items) out.push_back(try_assign(item.drone_id, item.task));
  return out;
}

std::optional<Task> FleetService::cancel_task(const std::string& drone_id) {
  std::lock_guard<std::mutex> lock(mu_);
  return sim_.cancel_task(drone_id);
}

WorldSnapshot FleetService::snapshot() const { return snapshot(cfg_.snapshot_event_limit); }

WorldSnapshot FleetService::snapshot(std::size_t event_limit) const {
  std::lock_guard<std::mutex> lock(mu_);
  return sim_.snapshot(event_limit);
}

void FleetService::tick() {
  std::lock_guard<std::mutex> lock(mu_);
  sim_.tick();
}

void FleetService::step(int ticks) {
  // One lock per tick so commands can interleave between ticks.
  for (int i = 0; i < ticks; ++i) tick();
}

std::int64_t FleetService::tick_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return sim_.world().tick;
}

double FleetService::time_s() const {
  std::lock_guard<std::mutex> lock(mu_);
  return sim_.world().time_s;
}

ClockReading FleetService::clock() const {
  std::lock_guard<std::mutex> lock(mu_);
  return {sim_.world().tick, sim_.world().time_s};
}

bool FleetService::has_agent(const std::string& drone_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return find_ptr(sim_.world().agents, drone_id) != nullptr;
}

void FleetService::with_simulation(const std::function<void(const Simulation&)>& fn) const {
  std::lock_guard<std::mutex> lock(mu_);
  fn(sim_);
}

} // namespace dronefleet
