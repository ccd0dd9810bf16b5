#pragma once

#include <SDL.h>

#include <cstdint>

#include "dronefleet/core/clock_runner.h"
#include "dronefleet/core/fleet_service.h"

#include "ui/ui_state.h"

namespace dronefleet::ui {

class App {
 public:
  // Starts the clock runner; the viewer only talks to the world through
  // FleetService.
  App(World world, SimConfig cfg);
  ~App();

  // Called once per frame.
  void frame();

  void on_event(const SDL_Event& e);

 private:
  void update_trails(const WorldSnapshot& snap);
  void draw_controls_window(const WorldSnapshot& snap);

  FleetService service_;
  ClockRunner clock_;
  UIState ui_{};

  std::int64_t last_trail_tick_{-1};
};

} // namespace dronefleet::ui
