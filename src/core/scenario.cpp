#include "dronefleet/core/scenario.h"

#include <random>
#include <stdexcept>

#include "dronefleet/core/enum_strings.h"
#include "dronefleet/core/task_codec.h"
#include "dronefleet/util/file_io.h"
#include "dronefleet/util/sorted_keys.h"
#include "dronefleet/util/state_export.h"

namespace dronefleet {
namespace {

constexpr double kRosterMargin = 5.0;

double rand_real(std::mt19937& rng, double lo, double hi) {
  std::uniform_real_distribution<double> dist(lo, hi);
  return dist(rng);
}

int rand_int(std::mt19937& rng, int lo, int hi) {
  std::uniform_int_distribution<int> dist(lo, hi);
  return dist(rng);
}

void add_agent(World& w, const std::string& id, AgentKind kind, const Vec2& pos) {
  Agent a;
  a.id = id;
  a.kind = kind;
  a.position = pos;
  a.home = pos;
  w.agents[id] = std::move(a);
}

World make_standard_roster() {
  World w;
  w.bounds = WorldBounds{100.0, 100.0};
  const double W = w.bounds.width;
  const double H = w.bounds.height;

  add_agent(w, "D1", AgentKind::Scout, {kRosterMargin, kRosterMargin});
  add_agent(w, "D2", AgentKind::Scout, {W - kRosterMargin, kRosterMargin});
  add_agent(w, "D3", AgentKind::Scout, {kRosterMargin, H - kRosterMargin});
  add_agent(w, "D4", AgentKind::Scout, {W - kRosterMargin, H - kRosterMargin});

  // Firefighter dock: four bays 4 units apart, centred on the bottom edge.
  const double dock_x0 = W * 0.5 - 6.0;
  for (int i = 0; i < 4; ++i) {
    add_agent(w, "FD" + std::to_string(i + 1), AgentKind::Firefighter,
              {dock_x0 + 4.0 * static_cast<double>(i), kRosterMargin});
  }
  return w;
}

// --- JSON helpers ---

const json::Value& require(const json::Value& obj, const std::string& key, const std::string& where) {
  const json::Value* v = obj.find(key);
  if (!v) throw std::runtime_error(where + " is missing '" + key + "'");
  return *v;
}

double require_number(const json::Value& obj, const std::string& key, const std::string& where) {
  const json::Value& v = require(obj, key, where);
  const double* d = v.as_number();
  if (!d) throw std::runtime_error(where + "." + key + " must be a number (got " + json::type_name(v) + ")");
  return *d;
}

double optional_number(const json::Value& obj, const std::string& key, double def, const std::string& where) {
  if (!obj.find(key)) return def;
  return require_number(obj, key, where);
}

Vec2 read_vec2(const json::Value& v, const std::string& where) {
  if (!v.is_object()) throw std::runtime_error(where + " must be an object with x and y");
  return {require_number(v, "x", where), require_number(v, "y", where)};
}

Rect read_rect(const json::Value& v, const std::string& where) {
  if (!v.is_object()) throw std::runtime_error(where + " must be an object");
  Rect r;
  r.xmin = require_number(v, "xmin", where);
  r.xmax = require_number(v, "xmax", where);
  r.ymin = require_number(v, "ymin", where);
  r.ymax = require_number(v, "ymax", where);
  return r;
}

} // namespace

World make_default_scenario(std::uint32_t seed) {
  World w = make_standard_roster();
  std::mt19937 rng(seed);

  constexpr double kFireSizeMin = 6.0;
  constexpr double kFireSizeMax = 12.0;
  constexpr double kBorder = 8.0;

  const int n_fire = rand_int(rng, 2, 3);
  for (int i = 0; i < n_fire; ++i) {
    const double zw = rand_real(rng, kFireSizeMin, kFireSizeMax);
    const double zh = rand_real(rng, kFireSizeMin, kFireSizeMax);
    const double xmin = rand_real(rng, kBorder, w.bounds.width - kBorder - zw);
    const double ymin = rand_real(rng, kBorder, w.bounds.height - kBorder - zh);

    Zone z;
    z.id = "z_fire_" + std::to_string(i + 1);
    z.name = "FireZone-" + std::to_string(i + 1);
    z.type = ZoneType::FireRisk;
    z.rect = Rect{xmin, xmin + zw, ymin, ymin + zh};
    z.base_severity = rand_real(rng, 0.75, 0.95);
    z.base_confidence = rand_real(rng, 0.75, 0.95);
    w.zones.push_back(std::move(z));
  }
  return w;
}

World make_demo_scenario() {
  World w = make_standard_roster();
  Zone z;
  z.id = "z_fire";
  z.name = "FireZone";
  z.type = ZoneType::FireRisk;
  z.rect = Rect{42.0, 58.0, 42.0, 58.0};
  w.zones.push_back(std::move(z));
  return w;
}

World scenario_from_json(const json::Value& v) {
  if (!v.is_object()) throw std::runtime_error("Scenario must be a JSON object");

  World w;
  if (const json::Value* b = v.find("bounds")) {
    w.bounds.width = require_number(*b, "width", "bounds");
    w.bounds.height = require_number(*b, "height", "bounds");
  }

  const json::Value& drones = require(v, "drones", "scenario");
  if (!drones.is_array()) throw std::runtime_error("scenario.drones must be an array");
  for (std::size_t i = 0; i < drones.array().size(); ++i) {
    const json::Value& d = drones.array()[i];
    const std::string where = "drones[" + std::to_string(i) + "]";

    Agent a;
    a.id = require(d, "id", where).string_value();
    if (a.id.empty()) throw std::runtime_error(where + ".id must be a non-empty string");
    if (w.agents.count(a.id)) throw std::runtime_error("Duplicate drone id: " + a.id);

    if (const json::Value* k = d.find("kind")) {
      if (!agent_kind_from_string(k->string_value(), a.kind)) {
        throw std::runtime_error(where + ".kind is not a known drone kind: " + k->string_value());
      }
    }
    a.position = read_vec2(require(d, "pos", where), where + ".pos");
    a.home = d.find("home") ? read_vec2(*d.find("home"), where + ".home") : a.position;
    a.battery = optional_number(d, "battery", kBatteryCapacity, where);
    w.agents[a.id] = std::move(a);
  }

  if (const json::Value* zones = v.find("zones")) {
    if (!zones->is_array()) throw std::runtime_error("scenario.zones must be an array");
    for (std::size_t i = 0; i < zones->array().size(); ++i) {
      const json::Value& zv = zones->array()[i];
      const std::string where = "zones[" + std::to_string(i) + "]";

      Zone z;
      z.id = require(zv, "id", where).string_value();
      z.name = zv.find("name") ? zv.find("name")->string_value() : z.id;
      const std::string type = require(zv, "type", where).string_value();
      if (!zone_type_from_string(type, z.type)) throw std::runtime_error(where + ".type is not a zone type: " + type);
      z.rect = read_rect(require(zv, "rect", where), where + ".rect");
      z.base_severity = optional_number(zv, "base_severity", z.base_severity, where);
      z.base_confidence = optional_number(zv, "base_confidence", z.base_confidence, where);
      if (const json::Value* trig = zv.find("trigger")) {
        const std::string name = trig->string_value();
        if (!zone_trigger_from_string(name, z.trigger)) {
          throw std::runtime_error(where + ".trigger must be ON_ENTER or ON_STAY: " + name);
        }
      }
      z.cooldown_s = optional_number(zv, "cooldown_s", z.cooldown_s, where);
      w.zones.push_back(std::move(z));
    }
  }

  return w;
}

World load_scenario_from_file(const std::string& path) {
  return scenario_from_json(json::parse(read_text_file(path)));
}

json::Value scenario_to_json(const World& world) {
  json::Object bounds;
  bounds["width"] = world.bounds.width;
  bounds["height"] = world.bounds.height;

  json::Array drones;
  for (const auto& id : util::sorted_keys(world.agents)) {
    const Agent& a = world.agents.at(id);
    json::Object o;
    o["id"] = a.id;
    o["kind"] = agent_kind_to_string(a.kind);
    o["pos"] = vec2_to_json(a.position);
    o["home"] = vec2_to_json(a.home);
    o["battery"] = a.battery;
    drones.push_back(std::move(o));
  }

  json::Array zones;
  for (const Zone& z : world.zones) zones.push_back(zone_to_json(z));

  json::Object root;
  root["bounds"] = std::move(bounds);
  root["drones"] = std::move(drones);
  root["zones"] = std::move(zones);
  return root;
}

} // namespace dronefleet
