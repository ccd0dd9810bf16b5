#pragma once

#include <iosfwd>
#include <string>

#include "dronefleet/core/fleet_service.h"
#include "dronefleet/util/json.h"

namespace dronefleet {

// JSON request/response layer over a FleetService.
//
// Requests are objects with an "op" field:
//   {"op":"health"}
//   {"op":"state"}                                  optional "event_limit"
//   {"op":"assign_task", "drone_id":"D1", "task":{...}}
//   {"op":"batch", "commands":[{"drone_id":"D1", "task":{...}}, ...]}
//   {"op":"cancel_task", "drone_id":"D1"}
//   {"op":"step", "ticks":N}
//
// Client errors come back as {ok:false, status:400, kind, error}; handle()
// itself never throws for a bad request.
class CommandApi {
 public:
  explicit CommandApi(FleetService& service) : service_(service) {}

  json::Value handle(const json::Value& request);

  // Parses `line` and dispatches it. Malformed JSON yields a client error.
  std::string handle_line(const std::string& line);

  json::Value health() const;
  json::Value state(const json::Value& request) const;
  json::Value assign_task(const json::Value& request);
  json::Value batch(const json::Value& request);
  json::Value cancel_task(const json::Value& request);
  json::Value step(const json::Value& request);

 private:
  FleetService& service_;
};

// {ok:false, status:400, kind, error}
json::Value client_error(const std::string& kind, const std::string& message);

// Request console: one JSON request per input line, one compact JSON response
// per output line. Blank lines and lines starting with '#' are skipped.
// Stops at end of input or after {"op":"quit"}. Returns the number of requests
// answered.
int serve_lines(CommandApi& api, std::istream& in, std::ostream& out);

} // namespace dronefleet
