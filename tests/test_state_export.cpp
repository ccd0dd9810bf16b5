#include <iostream>
#include <string>

#include "dronefleet/core/simulation.h"
#include "dronefleet/util/json.h"
#include "dronefleet/util/state_export.h"

#define DF_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_state_export() {
  using namespace dronefleet;

  Agent a;
  a.id = "FD1";
  a.kind = AgentKind::Firefighter;
  a.position = {44.0, 5.0};
  a.home = {44.0, 5.0};
  a.battery = 87.5;

  {
    const json::Value v = agent_to_json(a);
    DF_ASSERT(v.at("id").string_value() == "FD1");
    DF_ASSERT(v.at("kind").string_value() == "firefighter");
    DF_ASSERT(v.at("status").string_value() == "IDLE");
    DF_ASSERT(v.at("battery").number_value() == 87.5);
    DF_ASSERT(v.at("task").is_null());
    DF_ASSERT(v.at("pos").at("x").number_value() == 44.0);
  }

  {
    HoldTask h;
    h.id = "hold_3";
    h.agent_id = "FD1";
    a.task = h;
    a.status = AgentStatus::Holding;
    const json::Value v = agent_to_json(a);
    DF_ASSERT(v.at("status").string_value() == "HOLDING");
    DF_ASSERT(v.at("task").at("type").string_value() == "HOLD");
  }

  WorldEvent ev;
  ev.seq = 12;
  ev.ts = 3.4;
  ev.type = EventType::FireDetected;
  ev.agent_id = "D1";
  ev.position = {50.0, 50.0};
  ev.message = "Possible fire detected near FireZone";
  ev.payload["zone_id"] = "z_fire";
  ev.severity = 0.75;
  ev.confidence = 0.9;

  {
    const json::Value v = event_to_json(ev);
    DF_ASSERT(v.at("seq").int_value() == 12);
    DF_ASSERT(v.at("type").string_value() == "FIRE_DETECTED");
    DF_ASSERT(v.at("drone_id").string_value() == "D1");
    DF_ASSERT(v.at("payload").at("zone_id").string_value() == "z_fire");

    WorldEvent anon = ev;
    anon.agent_id.clear();
    DF_ASSERT(event_to_json(anon).at("drone_id").is_null());
  }

  // JSONL: one compact object per line, in order.
  {
    WorldEvent second = ev;
    second.seq = 13;
    const std::string jsonl = events_to_jsonl({ev, second});
    const auto nl = jsonl.find('\n');
    DF_ASSERT(nl != std::string::npos);
    DF_ASSERT(jsonl.back() == '\n');
    DF_ASSERT(json::parse(jsonl.substr(0, nl)).at("seq").int_value() == 12);
    DF_ASSERT(json::parse(jsonl.substr(nl + 1)).at("seq").int_value() == 13);
    DF_ASSERT(events_to_jsonl({}).empty());
  }

  // Snapshot document shape.
  {
    WorldSnapshot snap;
    snap.tick = 17;
    snap.time_s = 3.4;
    snap.agents.push_back(a);
    Zone z;
    z.id = "z_fire";
    z.name = "FireZone";
    z.rect = Rect{42.0, 58.0, 42.0, 58.0};
    snap.zones.push_back(z);
    snap.recent_events.push_back(ev);

    const json::Value v = snapshot_to_json(snap);
    DF_ASSERT(v.at("tick").int_value() == 17);
    DF_ASSERT(v.at("ts").number_value() == 3.4);
    DF_ASSERT(v.at("bounds").at("height").number_value() == 100.0);
    DF_ASSERT(v.at("drones").array().size() == 1);
    DF_ASSERT(v.at("zones").at(std::size_t{0}).at("rect").at("xmax").number_value() == 58.0);
    DF_ASSERT(v.at("zones").at(std::size_t{0}).at("type").string_value() == "FIRE_RISK");
    DF_ASSERT(v.at("recent_events").array().size() == 1);

    // Compact output is stable.
    const std::string text = json::stringify(v, 0);
    DF_ASSERT(text.find('\n') == std::string::npos);
    DF_ASSERT(text.rfind("{\"bounds\":", 0) == 0);
    DF_ASSERT(json::stringify(json::parse(text), 0) == text);
  }

  return 0;
}
