#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "dronefleet/core/clock_runner.h"
#include "dronefleet/core/fleet_service.h"
#include "dronefleet/core/scenario.h"
#include "dronefleet/util/json.h"
#include "dronefleet/util/log.h"
#include "dronefleet/util/state_export.h"

#define DF_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

dronefleet::GotoTask goto_task(double x, double y) {
  dronefleet::GotoTask g;
  g.target = {x, y};
  return g;
}

std::string snapshot_text(const dronefleet::FleetService& svc) {
  return dronefleet::json::stringify(dronefleet::snapshot_to_json(svc.snapshot()), 0);
}

} // namespace

int test_fleet_service() {
  using namespace dronefleet;

  const log::Level saved_level = log::level();
  log::set_level(log::Level::Off);

  // Batch items succeed or fail independently, in order.
  {
    FleetService svc(make_demo_scenario(), SimConfig{});

    HoldTask hold_fd2;
    hold_fd2.agent_id = "FD2";

    std::vector<AssignRequest> batch;
    batch.push_back({"D1", goto_task(20.0, 20.0)});
    batch.push_back({"D9", goto_task(20.0, 20.0)});
    batch.push_back({"D2", goto_task(-1.0, 20.0)});
    batch.push_back({"FD2", hold_fd2});

    const auto results = svc.assign_batch(batch);
    DF_ASSERT(results.size() == 4);

    DF_ASSERT(results[0].ok);
    DF_ASSERT(results[0].drone_id == "D1");
    DF_ASSERT(results[0].assigned.has_value());
    DF_ASSERT(task_id(*results[0].assigned) == "goto_0");

    DF_ASSERT(!results[1].ok);
    DF_ASSERT(results[1].error_kind == ErrorKind::NotFound);
    DF_ASSERT(results[1].error == "Unknown drone_id=D9");

    DF_ASSERT(!results[2].ok);
    DF_ASSERT(results[2].error_kind == ErrorKind::InvalidTask);

    DF_ASSERT(results[3].ok);

    const WorldSnapshot snap = svc.snapshot();
    for (const Agent& a : snap.agents) {
      if (a.id == "D1") DF_ASSERT(a.status == AgentStatus::Navigating);
      if (a.id == "D2") DF_ASSERT(a.status == AgentStatus::Idle);
      if (a.id == "FD2") DF_ASSERT(a.status == AgentStatus::Holding);
    }
  }

  // Snapshots are copies: repeated reads match, later ticks don't leak in.
  {
    FleetService svc(make_demo_scenario(), SimConfig{});
    svc.assign_task("D1", goto_task(50.0, 50.0));
    svc.step(250);

    const WorldSnapshot held = svc.snapshot();
    const std::string a = snapshot_text(svc);
    const std::string b = snapshot_text(svc);
    DF_ASSERT(a == b);

    svc.step(5);
    DF_ASSERT(held.tick == 250);
    DF_ASSERT(svc.tick_count() == 255);
    DF_ASSERT(svc.time_s() == 255 * 0.2);
    const ClockReading now = svc.clock();
    DF_ASSERT(now.tick == 255);
    DF_ASSERT(now.time_s == svc.time_s());
    DF_ASSERT(svc.has_agent("FD3"));
    DF_ASSERT(!svc.has_agent("D9"));
    DF_ASSERT(!svc.has_agent(""));
    DF_ASSERT(snapshot_text(svc) != a);

    // Sorted drone ids.
    for (std::size_t i = 1; i < held.agents.size(); ++i) DF_ASSERT(held.agents[i - 1].id < held.agents[i].id);

    DF_ASSERT(svc.snapshot(1).recent_events.size() <= 1);
  }

  // Cancel and the throwing assign.
  {
    FleetService svc(make_demo_scenario(), SimConfig{});
    svc.assign_task("D4", goto_task(60.0, 60.0));
    const auto prev = svc.cancel_task("D4");
    DF_ASSERT(prev.has_value());

    bool threw = false;
    try {
      svc.assign_task("nope", goto_task(1.0, 1.0));
    } catch (const CommandError& e) {
      threw = e.kind() == ErrorKind::NotFound;
    }
    DF_ASSERT(threw);

    bool saw_idle = false;
    svc.with_simulation([&](const Simulation& sim) {
      saw_idle = sim.world().agents.at("D4").status == AgentStatus::Idle;
    });
    DF_ASSERT(saw_idle);
  }

  // Background clock with concurrent commands and readers.
  {
    SimConfig cfg;
    cfg.time_scale = 200.0;
    FleetService svc(make_demo_scenario(), cfg);
    ClockRunner clock(svc);
    clock.start();
    DF_ASSERT(clock.running());

    std::atomic<int> failures{0};
    std::atomic<int> assigns{0};

    std::thread writer([&] {
      const char* ids[] = {"D1", "D2", "D3", "D4"};
      for (int i = 0; i < 200; ++i) {
        const double c = 10.0 + static_cast<double>(i % 80);
        const AssignResult r = svc.try_assign(ids[i % 4], goto_task(c, 100.0 - c));
        if (!r.ok) ++failures;
        ++assigns;
      }
    });

    std::thread reader([&] {
      std::int64_t last_tick = -1;
      for (int i = 0; i < 200; ++i) {
        const WorldSnapshot snap = svc.snapshot();
        if (snap.tick < last_tick) ++failures;
        if (snap.time_s != static_cast<double>(snap.tick) * 0.2) ++failures;
        if (snap.agents.size() != 8) ++failures;
        for (const WorldEvent& ev : snap.recent_events) {
          if (ev.ts > snap.time_s) ++failures;
        }
        last_tick = snap.tick;
      }
    });

    writer.join();
    reader.join();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (clock.ticks_run() < 3 && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    clock.stop();

    DF_ASSERT(!clock.running());
    DF_ASSERT(failures.load() == 0);
    DF_ASSERT(assigns.load() == 200);
    DF_ASSERT(clock.ticks_run() >= 3);
    DF_ASSERT(svc.tick_count() == clock.ticks_run());

    // Stopped means stopped.
    const std::int64_t after = svc.tick_count();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    DF_ASSERT(svc.tick_count() == after);
  }

  log::set_level(saved_level);
  return 0;
}
