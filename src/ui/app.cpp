#include "ui/app.h"

#include <imgui.h>

#include <algorithm>
#include <string>

#include "dronefleet/util/log.h"
#include "ui/fleet_map.h"
#include "ui/panels.h"

namespace dronefleet::ui {

App::App(World world, SimConfig cfg) : service_(std::move(world), std::move(cfg)), clock_(service_) {
  const WorldSnapshot snap = service_.snapshot();
  if (!snap.agents.empty()) ui_.selected_drone = snap.agents.front().id;
  clock_.start();
}

App::~App() { clock_.stop(); }

void App::on_event(const SDL_Event& e) {
  // Escape drops an unfinished Alt+click path.
  if (e.type == SDL_KEYDOWN && e.key.keysym.sym == SDLK_ESCAPE && !ImGui::GetIO().WantTextInput) {
    ui_.path_draft.clear();
  }
}

void App::update_trails(const WorldSnapshot& snap) {
  if (snap.tick == last_trail_tick_) return;
  last_trail_tick_ = snap.tick;

  const std::size_t max_len = static_cast<std::size_t>(std::max(ui_.trail_length, 2));
  for (const Agent& a : snap.agents) {
    auto& trail = ui_.trails[a.id];
    if (!trail.empty() && trail.back() == a.position) continue;
    trail.push_back(a.position);
    while (trail.size() > max_len) trail.pop_front();
  }
}

void App::draw_controls_window(const WorldSnapshot& snap) {
  ImGui::Text("t = %.1f s   tick %lld", snap.time_s, static_cast<long long>(snap.tick));

  if (clock_.running()) {
    if (ImGui::Button("Pause")) clock_.stop();
  } else {
    if (ImGui::Button("Resume")) clock_.start();
    ImGui::SameLine();
    if (ImGui::Button("Step")) service_.tick();
    ImGui::SameLine();
    if (ImGui::Button("Step x50")) service_.step(50);
  }
  ImGui::SameLine();
  ImGui::TextDisabled("dt %.2f s  x%.1f", service_.cfg().tick_seconds, service_.cfg().time_scale);

  ImGui::Checkbox("Trails", &ui_.show_trails);
  ImGui::SameLine();
  ImGui::Checkbox("Targets", &ui_.show_targets);
  ImGui::SameLine();
  ImGui::Checkbox("Zone labels", &ui_.show_zone_labels);
  ImGui::SetNextItemWidth(150.0f);
  ImGui::SliderInt("Trail length", &ui_.trail_length, 2, 600);
  if (ImGui::Button("Reset view")) {
    ui_.map_zoom = 1.0;
    ui_.map_pan = Vec2{0.0, 0.0};
  }

  ImGui::Separator();
  draw_task_panel(service_, snap, ui_);

  if (!ui_.last_command_status.empty()) {
    ImGui::Separator();
    const ImVec4 col = ui_.last_command_ok ? ImVec4(0.5f, 0.9f, 0.5f, 1.0f) : ImVec4(1.0f, 0.45f, 0.4f, 1.0f);
    ImGui::TextColored(col, "%s", ui_.last_command_status.c_str());
  }
}

void App::frame() {
  const WorldSnapshot snap = service_.snapshot();
  update_trails(snap);

  const ImGuiIO& io = ImGui::GetIO();
  if (!io.WantTextInput) {
    if (ImGui::IsKeyPressed(ImGuiKey_Space)) {
      if (clock_.running()) {
        clock_.stop();
      } else {
        clock_.start();
      }
    }
    if (io.KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_1)) ui_.show_controls_window = !ui_.show_controls_window;
    if (io.KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_2)) ui_.show_map_window = !ui_.show_map_window;
    if (io.KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_3)) ui_.show_drones_window = !ui_.show_drones_window;
    if (io.KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_4)) ui_.show_events_window = !ui_.show_events_window;
  }

  if (ImGui::BeginMainMenuBar()) {
    if (ImGui::BeginMenu("View")) {
      ImGui::MenuItem("Controls", "Ctrl+1", &ui_.show_controls_window);
      ImGui::MenuItem("Map", "Ctrl+2", &ui_.show_map_window);
      ImGui::MenuItem("Drones", "Ctrl+3", &ui_.show_drones_window);
      ImGui::MenuItem("Events", "Ctrl+4", &ui_.show_events_window);
      ImGui::EndMenu();
    }
    ImGui::EndMainMenuBar();
  }

  if (ui_.show_controls_window) {
    ImGui::SetNextWindowPos(ImVec2(10, 30), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(360, 420), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Controls", &ui_.show_controls_window)) draw_controls_window(snap);
    ImGui::End();
  }

  if (ui_.show_map_window) {
    ImGui::SetNextWindowPos(ImVec2(380, 30), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(560, 560), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Map", &ui_.show_map_window, ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoScrollWithMouse)) {
      draw_fleet_map(service_, snap, ui_);
    }
    ImGui::End();
  }

  if (ui_.show_drones_window) {
    ImGui::SetNextWindowPos(ImVec2(950, 30), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(320, 300), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Drones", &ui_.show_drones_window)) draw_drone_table(service_, snap, ui_);
    ImGui::End();
  }

  if (ui_.show_events_window) {
    ImGui::SetNextWindowPos(ImVec2(950, 340), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(320, 360), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Events", &ui_.show_events_window)) draw_event_log(snap, ui_);
    ImGui::End();
  }
}

} // namespace dronefleet::ui
