#include "dronefleet/core/clock_runner.h"

#include <chrono>
#include <exception>
#include <string>

#include "dronefleet/core/fleet_service.h"
#include "dronefleet/util/log.h"

namespace dronefleet {

ClockRunner::ClockRunner(FleetService& service) : service_(service) {}

ClockRunner::~ClockRunner() { stop(); }

void ClockRunner::start() {
  if (thread_.joinable()) return;
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_requested_ = false;
  }
  running_ = true;
  thread_ = std::thread([this] { run(); });

  const SimConfig& cfg = service_.cfg();
  log::info("Clock started (dt=" + std::to_string(cfg.tick_seconds) + "s, time_scale=" +
            std::to_string(cfg.time_scale) + ")");
}

void ClockRunner::stop() {
  if (!thread_.joinable()) return;
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  thread_.join();
  running_ = false;
  log::info("Clock stopped after " + std::to_string(ticks_run_.load()) + " ticks");
}

void ClockRunner::run() {
  using clock = std::chrono::steady_clock;
  const SimConfig& cfg = service_.cfg();
  const auto period = std::chrono::duration_cast<clock::duration>(
      std::chrono::duration<double>(cfg.tick_seconds / cfg.time_scale));

  auto next = clock::now();
  while (true) {
    try {
      service_.tick();
    } catch (const std::exception& e) {
      log::error(std::string("Clock tick failed, stopping: ") + e.what());
      break;
    }
    ++ticks_run_;

    next += period;
    const auto now = clock::now();
    // Fell far behind (debugger, suspended process): resync instead of bursting.
    if (now > next + period * 4) next = now;

    std::unique_lock<std::mutex> lock(mu_);
    if (cv_.wait_until(lock, next, [this] { return stop_requested_; })) break;
  }
  running_ = false;
}

} // namespace dronefleet
