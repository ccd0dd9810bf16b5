#pragma once

#include <stdexcept>
#include <string>

namespace dronefleet {

enum class ErrorKind {
  // The referenced drone id is not in the world.
  NotFound,
  // The task payload breaks a structural rule (missing target, empty path,
  // non-positive epsilon, mismatched HOLD target, ...).
  InvalidTask,
  // Reserved: a request that raced an exclusive mutation. Not raised while
  // all mutation goes through FleetService.
  StateConflict,
};

const char* error_kind_to_string(ErrorKind k);

// Error raised by command operations. what() is the caller-facing message,
// e.g. "Unknown drone_id=D9".
class CommandError : public std::runtime_error {
 public:
  CommandError(ErrorKind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

inline CommandError unknown_drone_error(const std::string& drone_id) {
  return CommandError(ErrorKind::NotFound, "Unknown drone_id=" + drone_id);
}

inline CommandError invalid_task_error(const std::string& message) {
  return CommandError(ErrorKind::InvalidTask, message);
}

} // namespace dronefleet
