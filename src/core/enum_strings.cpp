#include "dronefleet/core/enum_strings.h"

#include "dronefleet/util/strings.h"

namespace dronefleet {

const char* agent_status_to_string(AgentStatus s) {
  switch (s) {
    case AgentStatus::Idle: return "IDLE";
    case AgentStatus::Navigating: return "NAVIGATING";
    case AgentStatus::Holding: return "HOLDING";
  }
  return "IDLE";
}

bool agent_status_from_string(const std::string& s, AgentStatus& out) {
  const std::string u = to_upper(s);
  if (u == "IDLE") {
    out = AgentStatus::Idle;
  } else if (u == "NAVIGATING") {
    out = AgentStatus::Navigating;
  } else if (u == "HOLDING") {
    out = AgentStatus::Holding;
  } else {
    return false;
  }
  return true;
}

const char* agent_kind_to_string(AgentKind k) {
  switch (k) {
    case AgentKind::Scout: return "scout";
    case AgentKind::Firefighter: return "firefighter";
  }
  return "scout";
}

bool agent_kind_from_string(const std::string& s, AgentKind& out) {
  const std::string l = to_lower(s);
  if (l == "scout") {
    out = AgentKind::Scout;
  } else if (l == "firefighter") {
    out = AgentKind::Firefighter;
  } else {
    return false;
  }
  return true;
}

const char* zone_type_to_string(ZoneType t) {
  switch (t) {
    case ZoneType::FireRisk: return "FIRE_RISK";
    case ZoneType::NoFly: return "NO_FLY";
    case ZoneType::SignalLoss: return "SIGNAL_LOSS";
    case ZoneType::Info: return "INFO";
  }
  return "INFO";
}

bool zone_type_from_string(const std::string& s, ZoneType& out) {
  const std::string u = to_upper(s);
  if (u == "FIRE_RISK") {
    out = ZoneType::FireRisk;
  } else if (u == "NO_FLY") {
    out = ZoneType::NoFly;
  } else if (u == "SIGNAL_LOSS") {
    out = ZoneType::SignalLoss;
  } else if (u == "INFO") {
    out = ZoneType::Info;
  } else {
    return false;
  }
  return true;
}

const char* zone_trigger_to_string(ZoneTrigger t) {
  switch (t) {
    case ZoneTrigger::OnEnter: return "ON_ENTER";
    case ZoneTrigger::OnStay: return "ON_STAY";
  }
  return "ON_ENTER";
}

bool zone_trigger_from_string(const std::string& s, ZoneTrigger& out) {
  const std::string u = to_upper(s);
  if (u == "ON_ENTER") {
    out = ZoneTrigger::OnEnter;
  } else if (u == "ON_STAY") {
    out = ZoneTrigger::OnStay;
  } else {
    return false;
  }
  return true;
}

const char* event_type_to_string(EventType t) {
  switch (t) {
    case EventType::FireDetected: return "FIRE_DETECTED";
    case EventType::NoFlyViolation: return "NO_FLY_VIOLATION";
    case EventType::SignalLoss: return "SIGNAL_LOSS";
    case EventType::EnterZone: return "ENTER_ZONE";
    case EventType::BatteryLow: return "BATTERY_LOW";
    case EventType::TaskFault: return "TASK_FAULT";
  }
  return "ENTER_ZONE";
}

const char* task_kind_to_string(TaskKind k) {
  switch (k) {
    case TaskKind::Goto: return "GOTO";
    case TaskKind::Path: return "PATH";
    case TaskKind::Hold: return "HOLD";
  }
  return "GOTO";
}

bool task_kind_from_string(const std::string& s, TaskKind& out) {
  const std::string u = to_upper(trim_copy(s));
  if (u == "GOTO") {
    out = TaskKind::Goto;
  } else if (u == "PATH") {
    out = TaskKind::Path;
  } else if (u == "HOLD") {
    out = TaskKind::Hold;
  } else {
    return false;
  }
  return true;
}

} // namespace dronefleet
