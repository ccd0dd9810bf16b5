#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "dronefleet/core/clock_runner.h"
#include "dronefleet/core/command_api.h"
#include "dronefleet/core/enum_strings.h"
#include "dronefleet/core/fleet_service.h"
#include "dronefleet/core/scenario.h"
#include "dronefleet/core/sim_config.h"
#include "dronefleet/util/file_io.h"
#include "dronefleet/util/json.h"
#include "dronefleet/util/log.h"
#include "dronefleet/util/state_export.h"
#include "dronefleet/util/strings.h"

namespace {

#ifndef DRONEFLEET_VERSION
#define DRONEFLEET_VERSION "unknown"
#endif

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stoi(argv[i + 1]);
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  std::cout << "DroneFleet CLI v" << DRONEFLEET_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "dronefleet_cli") << " [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --ticks N          Advance the simulation by N ticks (default: 50)\n";
  std::cout << "  --scenario NAME    default|demo, or a scenario JSON path (default: default)\n";
  std::cout << "  --seed N           Zone placement seed for the default scenario (default: 1)\n";
  std::cout << "  --config PATH      Simulation config JSON (default: built-in values)\n";
  std::cout << "  --commands PATH    JSON array of requests to apply before advancing\n";
  std::cout << "                     (same shape as --serve requests; \"step\" entries advance time)\n";
  std::cout << "  --dump             Print the resulting state JSON to stdout\n";
  std::cout << "  --dump-events      Print every retained event as JSON lines\n";
  std::cout << "  --save-state PATH  Write the resulting state JSON to PATH\n";
  std::cout << "  --save-scenario PATH  Write the starting roster and zones as a scenario file\n";
  std::cout << "  --serve            Request console: JSON requests on stdin, responses on stdout,\n";
  std::cout << "                     while the clock runs in real time\n";
  std::cout << "  --log-level LEVEL  debug|info|warn|error|off (default: info)\n";
  std::cout << "  --quiet            Suppress the summary output\n";
  std::cout << "  -h, --help         Show this help\n";
  std::cout << "  --version          Print version and exit\n";
}

dronefleet::World load_world(const std::string& scenario, int seed) {
  const std::string name = dronefleet::to_lower(scenario);
  if (name == "default") return dronefleet::make_default_scenario(static_cast<std::uint32_t>(seed));
  if (name == "demo") return dronefleet::make_demo_scenario();
  return dronefleet::load_scenario_from_file(scenario);
}

void print_summary(const dronefleet::WorldSnapshot& snap) {
  using dronefleet::format_fixed;
  std::cout << "t=" << format_fixed(snap.time_s, 1) << "s  tick=" << snap.tick << "\n\n";
  std::cout << "Drones:\n";
  for (const auto& a : snap.agents) {
    std::cout << "  " << a.id << " (" << dronefleet::agent_kind_to_string(a.kind) << ")  pos=("
              << format_fixed(a.position.x, 2) << ", " << format_fixed(a.position.y, 2) << ")  "
              << dronefleet::agent_status_to_string(a.status) << "  battery=" << format_fixed(a.battery, 2) << "%";
    if (a.task) std::cout << "  task=" << dronefleet::task_to_string(*a.task);
    std::cout << "\n";
  }
  std::cout << "\nZones:\n";
  for (const auto& z : snap.zones) {
    std::cout << "  " << z.id << " \"" << z.name << "\" " << dronefleet::zone_type_to_string(z.type) << "  x["
              << format_fixed(z.rect.xmin, 1) << ", " << format_fixed(z.rect.xmax, 1) << "] y["
              << format_fixed(z.rect.ymin, 1) << ", " << format_fixed(z.rect.ymax, 1) << "]\n";
  }
  std::cout << "\nRecent events: " << snap.recent_events.size() << "\n";
  for (const auto& ev : snap.recent_events) {
    std::cout << "  [" << format_fixed(ev.ts, 1) << "] " << dronefleet::event_type_to_string(ev.type) << " "
              << ev.agent_id << ": " << ev.message << "\n";
  }
}

// Returns the number of requests that came back with ok=false.
int run_command_script(dronefleet::CommandApi& api, const std::string& path, bool quiet) {
  const auto script = dronefleet::json::parse(dronefleet::read_text_file(path));
  if (!script.is_array()) throw std::runtime_error("Command script must be a JSON array: " + path);

  int failures = 0;
  for (const auto& request : script.array()) {
    const auto response = api.handle(request);
    const auto* ok = response.find("ok");
    if (!ok || !ok->bool_value()) ++failures;
    if (!quiet) std::cout << dronefleet::json::stringify(response, 0) << "\n";
  }
  return failures;
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << DRONEFLEET_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const std::string log_level = get_str_arg(argc, argv, "--log-level", "");
    if (!log_level.empty()) {
      dronefleet::log::Level lvl{};
      if (!dronefleet::log::parse_level(log_level, lvl)) {
        std::cerr << "Unknown --log-level: " << log_level << "\n\n";
        print_usage(argv[0]);
        return 2;
      }
      dronefleet::log::set_level(lvl);
    }

    const int ticks = get_int_arg(argc, argv, "--ticks", 50);
    const std::string scenario = get_str_arg(argc, argv, "--scenario", "default");
    const int seed = get_int_arg(argc, argv, "--seed", 1);
    const std::string config_path = get_str_arg(argc, argv, "--config", "");
    const std::string commands_path = get_str_arg(argc, argv, "--commands", "");
    const std::string save_state_path = get_str_arg(argc, argv, "--save-state", "");
    const std::string save_scenario_path = get_str_arg(argc, argv, "--save-scenario", "");

    const bool quiet = has_flag(argc, argv, "--quiet");
    const bool serve = has_flag(argc, argv, "--serve");

    if (ticks < 0) {
      std::cerr << "--ticks must be >= 0\n\n";
      print_usage(argv[0]);
      return 2;
    }

    const dronefleet::SimConfig cfg =
        config_path.empty() ? dronefleet::SimConfig{} : dronefleet::load_sim_config_from_file(config_path);

    dronefleet::World world = load_world(scenario, seed);
    if (!save_scenario_path.empty()) {
      dronefleet::write_text_file(save_scenario_path,
                                  dronefleet::json::stringify(dronefleet::scenario_to_json(world), 2) + "\n");
      if (!quiet) std::cout << "Scenario written to " << save_scenario_path << "\n";
    }

    dronefleet::FleetService service(std::move(world), cfg);
    dronefleet::CommandApi api(service);

    if (serve) {
      dronefleet::ClockRunner clock(service);
      clock.start();
      const int answered = dronefleet::serve_lines(api, std::cin, std::cout);
      clock.stop();
      dronefleet::log::info("Request console closed after " + std::to_string(answered) + " requests");
      return 0;
    }

    int failures = 0;
    if (!commands_path.empty()) failures = run_command_script(api, commands_path, quiet);

    service.step(ticks);

    const dronefleet::WorldSnapshot snap = service.snapshot();
    if (!quiet) print_summary(snap);

    if (has_flag(argc, argv, "--dump-events")) {
      const dronefleet::WorldSnapshot all = service.snapshot(0);
      std::cout << dronefleet::events_to_jsonl(all.recent_events);
    }

    if (!save_state_path.empty()) {
      dronefleet::write_text_file(save_state_path,
                                  dronefleet::json::stringify(dronefleet::snapshot_to_json(snap), 2) + "\n");
      if (!quiet) std::cout << "\nState written to " << save_state_path << "\n";
    }

    if (has_flag(argc, argv, "--dump")) {
      std::cout << dronefleet::json::stringify(dronefleet::snapshot_to_json(snap), 2) << "\n";
    }

    if (failures > 0) {
      dronefleet::log::warn(std::to_string(failures) + " scripted request(s) failed");
      return 1;
    }
    return 0;
  } catch (const std::exception& e) {
    dronefleet::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
