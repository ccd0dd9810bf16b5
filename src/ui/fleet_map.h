#pragma once

#include "dronefleet/core/fleet_service.h"

#include "ui/ui_state.h"

namespace dronefleet::ui {

// World map: zones, drone trails, task targets and drones coloured by status.
//
// Right click selects the nearest drone. With a drone selected, left click
// sends it a GOTO to the clicked point and Alt + left click appends a
// waypoint to the path draft.
void draw_fleet_map(FleetService& service, const WorldSnapshot& snap, UIState& ui);

} // namespace dronefleet::ui
