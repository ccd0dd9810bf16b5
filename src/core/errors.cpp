#include "dronefleet/core/errors.h"

namespace dronefleet {

const char* error_kind_to_string(ErrorKind k) {
  switch (k) {
    case ErrorKind::NotFound: return "NotFound";
    case ErrorKind::InvalidTask: return "InvalidTask";
    case ErrorKind::StateConflict: return "StateConflict";
  }
  return "InvalidTask";
}

} // namespace dronefleet
