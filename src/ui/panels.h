#pragma once

#include "dronefleet/core/fleet_service.h"

#include "ui/ui_state.h"

namespace dronefleet::ui {

// Table of drones with per-row select / HOLD / cancel buttons.
void draw_drone_table(FleetService& service, const WorldSnapshot& snap, UIState& ui);

// Recent events, newest last, filterable by text.
void draw_event_log(const WorldSnapshot& snap, UIState& ui);

// Task editor for the selected drone (GOTO epsilon, path draft, HOLD, home).
void draw_task_panel(FleetService& service, const WorldSnapshot& snap, UIState& ui);

// Records a command outcome for display in the controls window.
void report_command(UIState& ui, const AssignResult& res);

} // namespace dronefleet::ui
