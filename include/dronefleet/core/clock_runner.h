#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace dronefleet {

class FleetService;

// Background thread that ticks a FleetService in (scaled) real time.
//
// Each tick is followed by a wait of tick_seconds / time_scale wall seconds,
// measured from the previous deadline so pacing does not drift with tick cost.
// The service's lock is only held inside FleetService::tick(), so commands and
// snapshots interleave between ticks.
class ClockRunner {
 public:
  explicit ClockRunner(FleetService& service);
  ~ClockRunner();

  ClockRunner(const ClockRunner&) = delete;
  ClockRunner& operator=(const ClockRunner&) = delete;

  // No-op when already running.
  void start();

  // Blocks until the thread has finished its current tick and exited.
  void stop();

  bool running() const { return running_.load(); }

  // Ticks performed by this runner since construction.
  std::int64_t ticks_run() const { return ticks_run_.load(); }

 private:
  void run();

  FleetService& service_;
  std::thread thread_;

  std::mutex mu_;
  std::condition_variable cv_;
  bool stop_requested_{false};

  std::atomic<bool> running_{false};
  std::atomic<std::int64_t> ticks_run_{0};
};

} // namespace dronefleet
