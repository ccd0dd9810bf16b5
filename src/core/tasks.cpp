#include "dronefleet/core/tasks.h"

#include <sstream>
#include <type_traits>

namespace dronefleet {

TaskKind task_kind(const Task& task) {
  return std::visit(
      [](const auto& t) -> TaskKind {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, GotoTask>) {
          return TaskKind::Goto;
        } else if constexpr (std::is_same_v<T, PathTask>) {
          return TaskKind::Path;
        } else {
          return TaskKind::Hold;
        }
      },
      task);
}

const std::string& task_id(const Task& task) {
  return std::visit([](const auto& t) -> const std::string& { return t.id; }, task);
}

std::string auto_task_id(TaskKind kind, double world_time) {
  const char* prefix = "goto_";
  if (kind == TaskKind::Path) prefix = "path_";
  if (kind == TaskKind::Hold) prefix = "hold_";
  // Truncation toward zero, matching the ids existing clients already see.
  return prefix + std::to_string(static_cast<long long>(world_time * 10.0));
}

std::string task_to_string(const Task& task) {
  std::ostringstream ss;
  std::visit(
      [&](const auto& t) {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, GotoTask>) {
          ss << "GOTO (" << t.target.x << ", " << t.target.y << ") eps=" << t.arrive_eps;
        } else if constexpr (std::is_same_v<T, PathTask>) {
          ss << "PATH " << t.waypoints.size() << " waypoints" << (t.loop ? " loop" : "")
             << " cursor=" << t.cursor;
        } else {
          ss << "HOLD";
        }
        if (!t.id.empty()) ss << " [" << t.id << "]";
      },
      task);
  return ss.str();
}

} // namespace dronefleet
