#include "dronefleet/core/sim_config.h"

#include <cmath>
#include <stdexcept>
#include <unordered_set>

#include "dronefleet/util/file_io.h"

namespace dronefleet {
namespace {

double read_number(const json::Value& v, const std::string& key) {
  const double* d = v.as_number();
  if (!d) throw std::runtime_error("Config key '" + key + "' must be a number (got " + json::type_name(v) + ")");
  return *d;
}

std::size_t read_count(const json::Value& v, const std::string& key) {
  const double d = read_number(v, key);
  if (d < 0.0 || d != std::floor(d)) {
    throw std::runtime_error("Config key '" + key + "' must be a non-negative integer");
  }
  return static_cast<std::size_t>(d);
}

} // namespace

std::vector<std::string> validate_sim_config(const SimConfig& cfg) {
  std::vector<std::string> errors;
  const auto positive = [&](double v, const char* name) {
    if (!(v > 0.0) || !std::isfinite(v)) errors.push_back(std::string(name) + " must be > 0");
  };
  const auto non_negative = [&](double v, const char* name) {
    if (!(v >= 0.0) || !std::isfinite(v)) errors.push_back(std::string(name) + " must be >= 0");
  };

  positive(cfg.tick_seconds, "tick_seconds");
  positive(cfg.agent_speed, "agent_speed");
  non_negative(cfg.battery_drain_per_s, "battery_drain_per_s");
  if (!(cfg.battery_low_threshold >= 0.0 && cfg.battery_low_threshold <= 100.0)) {
    errors.push_back("battery_low_threshold must be within [0, 100]");
  }
  if (cfg.event_log_capacity == 0) errors.push_back("event_log_capacity must be >= 1");
  non_negative(cfg.event_max_age_s, "event_max_age_s");
  positive(cfg.time_scale, "time_scale");
  return errors;
}

SimConfig sim_config_from_json(const json::Value& v) {
  static const std::unordered_set<std::string> kKnown = {
      "tick_seconds",          "agent_speed",     "battery_drain_per_s",  "battery_low_threshold",
      "event_log_capacity",    "event_max_age_s", "snapshot_event_limit", "time_scale",
  };

  SimConfig cfg;
  for (const auto& [key, val] : v.object()) {
    if (kKnown.count(key) == 0) throw std::runtime_error("Unknown config key: " + key);
    if (key == "tick_seconds") cfg.tick_seconds = read_number(val, key);
    if (key == "agent_speed") cfg.agent_speed = read_number(val, key);
    if (key == "battery_drain_per_s") cfg.battery_drain_per_s = read_number(val, key);
    if (key == "battery_low_threshold") cfg.battery_low_threshold = read_number(val, key);
    if (key == "event_log_capacity") cfg.event_log_capacity = read_count(val, key);
    if (key == "event_max_age_s") cfg.event_max_age_s = read_number(val, key);
    if (key == "snapshot_event_limit") cfg.snapshot_event_limit = read_count(val, key);
    if (key == "time_scale") cfg.time_scale = read_number(val, key);
  }
  return cfg;
}

json::Value sim_config_to_json(const SimConfig& cfg) {
  json::Object o;
  o["tick_seconds"] = cfg.tick_seconds;
  o["agent_speed"] = cfg.agent_speed;
  o["battery_drain_per_s"] = cfg.battery_drain_per_s;
  o["battery_low_threshold"] = cfg.battery_low_threshold;
  o["event_log_capacity"] = static_cast<double>(cfg.event_log_capacity);
  o["event_max_age_s"] = cfg.event_max_age_s;
  o["snapshot_event_limit"] = static_cast<double>(cfg.snapshot_event_limit);
  o["time_scale"] = cfg.time_scale;
  return o;
}

SimConfig load_sim_config_from_file(const std::string& path) {
  const SimConfig cfg = sim_config_from_json(json::parse(read_text_file(path)));
  const auto errors = validate_sim_config(cfg);
  if (!errors.empty()) {
    std::string msg = "Invalid config " + path + ":";
    for (const auto& e : errors) msg += "\n  - " + e;
    throw std::runtime_error(msg);
  }
  return cfg;
}

} // namespace dronefleet
