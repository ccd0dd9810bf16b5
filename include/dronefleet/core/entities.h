#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "dronefleet/core/tasks.h"
#include "dronefleet/core/vec2.h"
#include "dronefleet/util/json.h"

namespace dronefleet {

enum class AgentStatus { Idle, Navigating, Holding };

// Drone class. Both move with the world speed; the kind is carried for callers
// that plan differently for scouts and firefighters.
enum class AgentKind { Scout, Firefighter };

enum class ZoneType { FireRisk, NoFly, SignalLoss, Info };

// When a zone reports an agent that is inside it. OnEnter fires once per
// dwell; OnStay also re-fires every `cooldown_s` while the agent stays.
enum class ZoneTrigger { OnEnter, OnStay };

enum class EventType {
  FireDetected,
  NoFlyViolation,
  SignalLoss,
  EnterZone,
  BatteryLow,
  TaskFault,
};

inline constexpr double kBatteryCapacity = 100.0;

// Axis-aligned rectangle with inclusive bounds.
struct Rect {
  double xmin{0.0};
  double xmax{0.0};
  double ymin{0.0};
  double ymax{0.0};

  bool contains(const Vec2& p) const { return p.x >= xmin && p.x <= xmax && p.y >= ymin && p.y <= ymax; }
  bool is_valid() const { return xmin <= xmax && ymin <= ymax; }
  Vec2 center() const { return {(xmin + xmax) * 0.5, (ymin + ymax) * 0.5}; }
  double width() const { return xmax - xmin; }
  double height() const { return ymax - ymin; }
};

struct Zone {
  std::string id;
  std::string name;
  ZoneType type{ZoneType::FireRisk};
  Rect rect;

  // Severity/confidence reported for a detection at the very edge of the
  // zone; detections nearer the centre score higher.
  double base_severity{0.5};
  double base_confidence{0.7};

  ZoneTrigger trigger{ZoneTrigger::OnEnter};
  // OnStay only: minimum gap between events of one dwell. 0 fires every tick.
  double cooldown_s{0.0};
};

struct Agent {
  std::string id;
  AgentKind kind{AgentKind::Scout};
  Vec2 position;
  Vec2 home;
  AgentStatus status{AgentStatus::Idle};
  double battery{kBatteryCapacity};

  std::optional<Task> task;

  // Latched once battery drops to the low threshold so BATTERY_LOW fires once.
  bool battery_low{false};

  // Set when the current task was found corrupt during a tick; cleared on the
  // next assignment.
  bool task_fault_reported{false};
};

struct WorldEvent {
  // Monotonic within a session; assigned when the event enters the log.
  std::uint64_t seq{0};

  // World time of the tick that produced the event.
  double ts{0.0};

  EventType type{EventType::FireDetected};
  std::string agent_id;
  Vec2 position;
  std::string message;
  json::Object payload;

  double severity{0.0};
  double confidence{0.0};
};

} // namespace dronefleet
