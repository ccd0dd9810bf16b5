#pragma once

#include <deque>
#include <string>
#include <unordered_map>
#include <vector>

#include "dronefleet/core/vec2.h"

namespace dronefleet::ui {

// Viewer-only state. Nothing here feeds back into the simulation except
// through FleetService commands.
struct UIState {
  std::string selected_drone;

  // Map view.
  double map_zoom{1.0};
  Vec2 map_pan{0.0, 0.0};
  bool show_trails{true};
  bool show_targets{true};
  bool show_zone_labels{true};

  // Recent positions per drone, oldest first.
  int trail_length{120};
  std::unordered_map<std::string, std::deque<Vec2>> trails;

  // Waypoints collected with Alt+click, sent as one PATH task.
  std::vector<Vec2> path_draft;
  bool path_loop{true};
  float goto_arrive_eps{2.0f};

  // Event panel.
  bool events_auto_scroll{true};
  char event_filter[64] = "";

  // Result of the last command issued from the viewer.
  std::string last_command_status;
  bool last_command_ok{true};

  bool show_controls_window{true};
  bool show_map_window{true};
  bool show_drones_window{true};
  bool show_events_window{true};
};

} // namespace dronefleet::ui
