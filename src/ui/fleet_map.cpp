#include "ui/fleet_map.h"

#include <imgui.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <type_traits>

#include "dronefleet/core/enum_strings.h"
#include "ui/panels.h"

namespace dronefleet::ui {
namespace {

ImU32 color_status(AgentStatus s) {
  switch (s) {
    case AgentStatus::Navigating: return IM_COL32(80, 200, 255, 255);
    case AgentStatus::Holding: return IM_COL32(255, 200, 60, 255);
    case AgentStatus::Idle: return IM_COL32(200, 200, 200, 255);
  }
  return IM_COL32(200, 200, 200, 255);
}

ImU32 color_zone_fill(ZoneType t) {
  switch (t) {
    case ZoneType::FireRisk: return IM_COL32(230, 70, 40, 60);
    case ZoneType::NoFly: return IM_COL32(200, 40, 200, 50);
    case ZoneType::SignalLoss: return IM_COL32(120, 120, 120, 60);
    case ZoneType::Info: return IM_COL32(60, 160, 90, 45);
  }
  return IM_COL32(120, 120, 120, 60);
}

ImU32 color_zone_edge(ZoneType t) {
  switch (t) {
    case ZoneType::FireRisk: return IM_COL32(255, 90, 50, 220);
    case ZoneType::NoFly: return IM_COL32(230, 70, 230, 220);
    case ZoneType::SignalLoss: return IM_COL32(170, 170, 170, 220);
    case ZoneType::Info: return IM_COL32(90, 200, 120, 220);
  }
  return IM_COL32(170, 170, 170, 220);
}

// World y grows upward; screen y grows downward.
struct MapTransform {
  ImVec2 origin;
  double scale{1.0};
  double height{100.0};

  ImVec2 to_screen(const Vec2& w) const {
    return ImVec2(static_cast<float>(origin.x + w.x * scale), static_cast<float>(origin.y + (height - w.y) * scale));
  }

  Vec2 to_world(const ImVec2& p) const { return {(p.x - origin.x) / scale, height - (p.y - origin.y) / scale}; }
};

void draw_task_target(ImDrawList* draw, const MapTransform& xf, const Agent& a, bool selected) {
  if (!a.task) return;
  const ImU32 col = selected ? IM_COL32(255, 255, 255, 200) : IM_COL32(255, 255, 255, 90);
  const ImVec2 from = xf.to_screen(a.position);

  std::visit(
      [&](const auto& t) {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, GotoTask>) {
          const ImVec2 p = xf.to_screen(t.target);
          draw->AddLine(from, p, col, 1.0f);
          draw->AddCircle(p, static_cast<float>(t.arrive_eps * xf.scale), col, 0, 1.0f);
        } else if constexpr (std::is_same_v<T, PathTask>) {
          for (std::size_t i = 0; i < t.waypoints.size(); ++i) {
            const ImVec2 p = xf.to_screen(t.waypoints[i]);
            if (i + 1 < t.waypoints.size()) {
              draw->AddLine(p, xf.to_screen(t.waypoints[i + 1]), col, 1.0f);
            } else if (t.loop && t.waypoints.size() > 1) {
              draw->AddLine(p, xf.to_screen(t.waypoints.front()), col, 1.0f);
            }
            const bool current = static_cast<int>(i) == t.cursor;
            draw->AddCircleFilled(p, current ? 4.0f : 2.5f, col);
          }
          if (t.cursor >= 0 && t.cursor < static_cast<int>(t.waypoints.size())) {
            draw->AddLine(from, xf.to_screen(t.waypoints[static_cast<std::size_t>(t.cursor)]), col, 1.0f);
          }
        } else {
          draw->AddRect(ImVec2(from.x - 8, from.y - 8), ImVec2(from.x + 8, from.y + 8), col, 0.0f, 0, 1.0f);
        }
      },
      *a.task);
}

} // namespace

void draw_fleet_map(FleetService& service, const WorldSnapshot& snap, UIState& ui) {
  const ImVec2 avail = ImGui::GetContentRegionAvail();
  const ImVec2 origin = ImGui::GetCursorScreenPos();
  if (avail.x < 10.0f || avail.y < 10.0f) return;

  const double fit = std::min(avail.x / snap.bounds.width, avail.y / snap.bounds.height);
  const double scale = fit * ui.map_zoom;

  const bool hovered = ImGui::IsWindowHovered(ImGuiHoveredFlags_AllowWhenBlockedByActiveItem);
  if (hovered) {
    const float wheel = ImGui::GetIO().MouseWheel;
    if (wheel != 0.0f) ui.map_zoom = std::clamp(ui.map_zoom * std::pow(1.1, wheel), 0.5, 8.0);

    // Pan with middle mouse drag.
    if (ImGui::IsMouseDown(ImGuiMouseButton_Middle)) {
      const ImVec2 d = ImGui::GetIO().MouseDelta;
      ui.map_pan.x += d.x;
      ui.map_pan.y += d.y;
    }
  }

  MapTransform xf;
  xf.origin = ImVec2(origin.x + static_cast<float>(ui.map_pan.x), origin.y + static_cast<float>(ui.map_pan.y));
  xf.scale = scale;
  xf.height = snap.bounds.height;

  auto* draw = ImGui::GetWindowDrawList();
  draw->PushClipRect(origin, ImVec2(origin.x + avail.x, origin.y + avail.y), true);
  draw->AddRectFilled(origin, ImVec2(origin.x + avail.x, origin.y + avail.y), IM_COL32(12, 16, 22, 255));

  // World boundary and a 10-unit grid.
  const ImVec2 w0 = xf.to_screen({0.0, snap.bounds.height});
  const ImVec2 w1 = xf.to_screen({snap.bounds.width, 0.0});
  for (double gx = 10.0; gx < snap.bounds.width; gx += 10.0) {
    draw->AddLine(xf.to_screen({gx, 0.0}), xf.to_screen({gx, snap.bounds.height}), IM_COL32(30, 36, 44, 255));
  }
  for (double gy = 10.0; gy < snap.bounds.height; gy += 10.0) {
    draw->AddLine(xf.to_screen({0.0, gy}), xf.to_screen({snap.bounds.width, gy}), IM_COL32(30, 36, 44, 255));
  }
  draw->AddRect(w0, w1, IM_COL32(90, 90, 90, 255));

  for (const Zone& z : snap.zones) {
    const ImVec2 a = xf.to_screen({z.rect.xmin, z.rect.ymax});
    const ImVec2 b = xf.to_screen({z.rect.xmax, z.rect.ymin});
    draw->AddRectFilled(a, b, color_zone_fill(z.type));
    draw->AddRect(a, b, color_zone_edge(z.type), 0.0f, 0, 1.5f);
    if (ui.show_zone_labels) draw->AddText(ImVec2(a.x + 3, a.y + 2), color_zone_edge(z.type), z.name.c_str());
  }

  if (ui.show_trails) {
    for (const Agent& ag : snap.agents) {
      auto it = ui.trails.find(ag.id);
      if (it == ui.trails.end() || it->second.size() < 2) continue;
      const ImU32 col = (color_status(ag.status) & 0x00FFFFFFu) | (90u << IM_COL32_A_SHIFT);
      for (std::size_t i = 1; i < it->second.size(); ++i) {
        draw->AddLine(xf.to_screen(it->second[i - 1]), xf.to_screen(it->second[i]), col, 1.5f);
      }
    }
  }

  if (ui.show_targets) {
    for (const Agent& ag : snap.agents) draw_task_target(draw, xf, ag, ag.id == ui.selected_drone);
  }

  // Path draft for the selected drone.
  for (std::size_t i = 0; i < ui.path_draft.size(); ++i) {
    const ImVec2 p = xf.to_screen(ui.path_draft[i]);
    draw->AddCircle(p, 5.0f, IM_COL32(120, 255, 120, 220), 0, 1.5f);
    if (i > 0) draw->AddLine(xf.to_screen(ui.path_draft[i - 1]), p, IM_COL32(120, 255, 120, 160), 1.0f);
  }

  for (const Agent& ag : snap.agents) {
    const ImVec2 p = xf.to_screen(ag.position);
    const float r = ag.kind == AgentKind::Firefighter ? 6.0f : 5.0f;
    if (ag.kind == AgentKind::Firefighter) {
      draw->AddTriangleFilled(ImVec2(p.x, p.y - r), ImVec2(p.x - r, p.y + r), ImVec2(p.x + r, p.y + r),
                              color_status(ag.status));
    } else {
      draw->AddCircleFilled(p, r, color_status(ag.status));
    }
    if (ag.id == ui.selected_drone) draw->AddCircle(p, r + 5.0f, IM_COL32(0, 255, 140, 255), 0, 2.0f);
    draw->AddText(ImVec2(p.x + r + 3, p.y - 7), IM_COL32(220, 220, 220, 255), ag.id.c_str());
  }

  draw->PopClipRect();

  // Keep ImGui's layout cursor consistent with what we drew.
  ImGui::InvisibleButton("##fleet_map", avail);

  if (!hovered || ImGui::IsAnyItemActive()) return;

  const ImVec2 mp = ImGui::GetIO().MousePos;
  const Vec2 world_pt = xf.to_world(mp);

  if (ImGui::IsMouseClicked(ImGuiMouseButton_Right)) {
    constexpr float kPickRadiusPx = 14.0f;
    float best = kPickRadiusPx * kPickRadiusPx;
    std::string picked;
    for (const Agent& ag : snap.agents) {
      const ImVec2 p = xf.to_screen(ag.position);
      const float d2 = (mp.x - p.x) * (mp.x - p.x) + (mp.y - p.y) * (mp.y - p.y);
      if (d2 <= best) {
        best = d2;
        picked = ag.id;
      }
    }
    if (picked != ui.selected_drone) ui.path_draft.clear();
    ui.selected_drone = picked;
  }

  if (ImGui::IsMouseClicked(ImGuiMouseButton_Left) && !ui.selected_drone.empty()) {
    if (world_pt.x < 0.0 || world_pt.x > snap.bounds.width || world_pt.y < 0.0 || world_pt.y > snap.bounds.height) {
      return;
    }
    if (ImGui::GetIO().KeyAlt) {
      ui.path_draft.push_back(world_pt);
      return;
    }
    GotoTask t;
    t.target = world_pt;
    t.arrive_eps = ui.goto_arrive_eps;
    report_command(ui, service.try_assign(ui.selected_drone, t));
  }

  if (hovered) {
    ImGui::BeginTooltip();
    ImGui::Text("(%.1f, %.1f)", world_pt.x, world_pt.y);
    ImGui::EndTooltip();
  }
}

} // namespace dronefleet::ui
