#include "ui/panels.h"

#include <imgui.h>

#include <string>
#include <vector>

#include "dronefleet/core/enum_strings.h"
#include "dronefleet/util/strings.h"

namespace dronefleet::ui {
namespace {

ImVec4 color_event(EventType t) {
  switch (t) {
    case EventType::FireDetected: return ImVec4(1.0f, 0.45f, 0.3f, 1.0f);
    case EventType::NoFlyViolation: return ImVec4(0.95f, 0.4f, 0.95f, 1.0f);
    case EventType::SignalLoss: return ImVec4(0.7f, 0.7f, 0.7f, 1.0f);
    case EventType::EnterZone: return ImVec4(0.5f, 0.85f, 0.55f, 1.0f);
    case EventType::BatteryLow: return ImVec4(1.0f, 0.85f, 0.3f, 1.0f);
    case EventType::TaskFault: return ImVec4(1.0f, 0.3f, 0.3f, 1.0f);
  }
  return ImVec4(1.0f, 1.0f, 1.0f, 1.0f);
}

const Agent* find_agent(const WorldSnapshot& snap, const std::string& id) {
  for (const Agent& a : snap.agents) {
    if (a.id == id) return &a;
  }
  return nullptr;
}

void send_hold(FleetService& service, UIState& ui, const std::string& drone_id) {
  HoldTask t;
  t.agent_id = drone_id;
  report_command(ui, service.try_assign(drone_id, t));
}

void send_cancel(FleetService& service, UIState& ui, const std::string& drone_id) {
  try {
    const auto prev = service.cancel_task(drone_id);
    ui.last_command_ok = true;
    ui.last_command_status = drone_id + (prev ? ": cancelled " + task_id(*prev) : ": no task to cancel");
  } catch (const CommandError& e) {
    ui.last_command_ok = false;
    ui.last_command_status = e.what();
  }
}

} // namespace

void report_command(UIState& ui, const AssignResult& res) {
  ui.last_command_ok = res.ok;
  if (res.ok) {
    ui.last_command_status = res.drone_id + ": " + task_to_string(*res.assigned);
  } else {
    ui.last_command_status = std::string(error_kind_to_string(res.error_kind)) + ": " + res.error;
  }
}

void draw_drone_table(FleetService& service, const WorldSnapshot& snap, UIState& ui) {
  const ImGuiTableFlags flags = ImGuiTableFlags_RowBg | ImGuiTableFlags_Borders | ImGuiTableFlags_SizingStretchProp |
                                ImGuiTableFlags_ScrollY;
  if (!ImGui::BeginTable("drones", 7, flags)) return;

  ImGui::TableSetupScrollFreeze(0, 1);
  ImGui::TableSetupColumn("Id");
  ImGui::TableSetupColumn("Kind");
  ImGui::TableSetupColumn("Position");
  ImGui::TableSetupColumn("Status");
  ImGui::TableSetupColumn("Battery");
  ImGui::TableSetupColumn("Task");
  ImGui::TableSetupColumn("");
  ImGui::TableHeadersRow();

  for (const Agent& a : snap.agents) {
    ImGui::PushID(a.id.c_str());
    ImGui::TableNextRow();

    ImGui::TableSetColumnIndex(0);
    if (ImGui::Selectable(a.id.c_str(), a.id == ui.selected_drone, ImGuiSelectableFlags_SpanAllColumns |
                                                                        ImGuiSelectableFlags_AllowOverlap)) {
      if (a.id != ui.selected_drone) ui.path_draft.clear();
      ui.selected_drone = a.id;
    }

    ImGui::TableSetColumnIndex(1);
    ImGui::TextUnformatted(agent_kind_to_string(a.kind));
    ImGui::TableSetColumnIndex(2);
    ImGui::Text("(%.1f, %.1f)", a.position.x, a.position.y);
    ImGui::TableSetColumnIndex(3);
    ImGui::TextUnformatted(agent_status_to_string(a.status));
    ImGui::TableSetColumnIndex(4);
    ImGui::ProgressBar(static_cast<float>(a.battery / kBatteryCapacity), ImVec2(-1.0f, 0.0f),
                       format_fixed(a.battery, 1).c_str());
    ImGui::TableSetColumnIndex(5);
    ImGui::TextUnformatted(a.task ? task_to_string(*a.task).c_str() : "-");

    ImGui::TableSetColumnIndex(6);
    if (ImGui::SmallButton("Hold")) send_hold(service, ui, a.id);
    ImGui::SameLine();
    if (ImGui::SmallButton("Cancel")) send_cancel(service, ui, a.id);

    ImGui::PopID();
  }
  ImGui::EndTable();
}

void draw_event_log(const WorldSnapshot& snap, UIState& ui) {
  ImGui::Checkbox("Auto-scroll", &ui.events_auto_scroll);
  ImGui::SameLine();
  ImGui::SetNextItemWidth(200.0f);
  ImGui::InputTextWithHint("##event_filter", "filter", ui.event_filter, sizeof(ui.event_filter));
  ImGui::SameLine();
  ImGui::TextDisabled("%d shown", static_cast<int>(snap.recent_events.size()));

  const std::string filter = to_lower(ui.event_filter);

  ImGui::BeginChild("event_list", ImVec2(0, 0), true);
  for (const WorldEvent& ev : snap.recent_events) {
    const std::string line = "[" + format_fixed(ev.ts, 1) + "] #" + std::to_string(ev.seq) + " " +
                             event_type_to_string(ev.type) + " " + ev.agent_id + ": " + ev.message;
    if (!filter.empty() && to_lower(line).find(filter) == std::string::npos) continue;

    ImGui::PushStyleColor(ImGuiCol_Text, color_event(ev.type));
    ImGui::TextUnformatted(line.c_str());
    ImGui::PopStyleColor();
    if (ImGui::IsItemHovered() && ev.severity > 0.0) {
      ImGui::SetTooltip("severity %.2f  confidence %.2f", ev.severity, ev.confidence);
    }
  }
  if (ui.events_auto_scroll && ImGui::GetScrollY() >= ImGui::GetScrollMaxY()) ImGui::SetScrollHereY(1.0f);
  ImGui::EndChild();
}

void draw_task_panel(FleetService& service, const WorldSnapshot& snap, UIState& ui) {
  const Agent* a = find_agent(snap, ui.selected_drone);
  if (!a) {
    ImGui::TextDisabled("No drone selected (right click on the map or pick a row)");
    return;
  }

  ImGui::Text("%s  %s  battery %.1f%%", a->id.c_str(), agent_status_to_string(a->status), a->battery);
  ImGui::TextDisabled("Left click: GOTO   Alt+click: add waypoint");

  ImGui::SetNextItemWidth(120.0f);
  ImGui::SliderFloat("GOTO arrive eps", &ui.goto_arrive_eps, 0.5f, 10.0f, "%.1f");

  if (ImGui::Button("Hold")) send_hold(service, ui, a->id);
  ImGui::SameLine();
  if (ImGui::Button("Return home")) {
    GotoTask t;
    t.target = a->home;
    t.arrive_eps = ui.goto_arrive_eps;
    report_command(ui, service.try_assign(a->id, t));
  }
  ImGui::SameLine();
  if (ImGui::Button("Cancel task")) send_cancel(service, ui, a->id);

  ImGui::Separator();
  ImGui::Text("Path draft: %d waypoint(s)", static_cast<int>(ui.path_draft.size()));
  ImGui::Checkbox("Loop", &ui.path_loop);
  ImGui::SameLine();
  ImGui::BeginDisabled(ui.path_draft.empty());
  if (ImGui::Button("Send path")) {
    PathTask t;
    t.waypoints = ui.path_draft;
    t.loop = ui.path_loop;
    const AssignResult res = service.try_assign(a->id, t);
    report_command(ui, res);
    if (res.ok) ui.path_draft.clear();
  }
  ImGui::SameLine();
  if (ImGui::Button("Clear draft")) ui.path_draft.clear();
  ImGui::EndDisabled();

  ImGui::Separator();
  if (ImGui::Button("All drones: hold")) {
    std::vector<AssignRequest> batch;
    for (const Agent& other : snap.agents) {
      HoldTask t;
      t.agent_id = other.id;
      batch.push_back({other.id, t});
    }
    int failed = 0;
    for (const AssignResult& r : service.assign_batch(batch)) failed += r.ok ? 0 : 1;
    ui.last_command_ok = failed == 0;
    ui.last_command_status = "Batch hold: " + std::to_string(batch.size() - static_cast<std::size_t>(failed)) + "/" +
                             std::to_string(batch.size()) + " assigned";
  }
}

} // namespace dronefleet::ui
