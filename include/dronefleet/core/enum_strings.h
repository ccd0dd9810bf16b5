#pragma once

#include <string>

#include "dronefleet/core/entities.h"

namespace dronefleet {

// Wire/UI names for the model enums. The *_from_string parsers are
// case-insensitive and return false for unknown names.

const char* agent_status_to_string(AgentStatus s);
bool agent_status_from_string(const std::string& s, AgentStatus& out);

const char* agent_kind_to_string(AgentKind k);
bool agent_kind_from_string(const std::string& s, AgentKind& out);

const char* zone_type_to_string(ZoneType t);
bool zone_type_from_string(const std::string& s, ZoneType& out);

const char* zone_trigger_to_string(ZoneTrigger t);
bool zone_trigger_from_string(const std::string& s, ZoneTrigger& out);

const char* event_type_to_string(EventType t);

const char* task_kind_to_string(TaskKind k);
bool task_kind_from_string(const std::string& s, TaskKind& out);

} // namespace dronefleet
