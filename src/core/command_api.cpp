#include "dronefleet/core/command_api.h"

#include <cmath>
#include <istream>
#include <ostream>
#include <stdexcept>

#include "dronefleet/core/errors.h"
#include "dronefleet/core/task_codec.h"
#include "dronefleet/util/log.h"
#include "dronefleet/util/state_export.h"
#include "dronefleet/util/strings.h"

namespace dronefleet {
namespace {

// Largest step accepted from one request (keeps a single request bounded).
constexpr int kMaxStepTicks = 100000;

// Largest event_limit accepted by state; no log is configured this large.
constexpr double kMaxEventLimit = 1000000.0;

std::string request_drone_id(const json::Value& request) {
  const json::Value* v = request.find("drone_id");
  if (!v || !v->is_string() || v->as_string()->empty()) {
    throw invalid_task_error("drone_id is required");
  }
  return *v->as_string();
}

const json::Value& request_task(const json::Value& request) {
  const json::Value* v = request.find("task");
  if (!v || v->is_null()) throw invalid_task_error("task is required");
  return *v;
}

json::Value assign_success(const std::string& drone_id, const Task& task) {
  json::Object o;
  o["ok"] = true;
  o["drone_id"] = drone_id;
  o["assigned"] = task_to_json(task);
  return o;
}

json::Value item_failure(const std::string& drone_id, const std::string& error) {
  json::Object o;
  o["ok"] = false;
  o["drone_id"] = drone_id;
  o["error"] = error;
  return o;
}

} // namespace

json::Value client_error(const std::string& kind, const std::string& message) {
  json::Object o;
  o["ok"] = false;
  o["status"] = 400;
  o["kind"] = kind;
  o["error"] = message;
  return o;
}

json::Value CommandApi::handle(const json::Value& request) {
  if (!request.is_object()) return client_error("BadRequest", "request must be a JSON object");

  const std::string op = to_lower(request.find("op") ? request.find("op")->string_value() : std::string());
  try {
    if (op == "health") return health();
    if (op == "state") return state(request);
    if (op == "assign_task") return assign_task(request);
    if (op == "batch") return batch(request);
    if (op == "cancel_task") return cancel_task(request);
    if (op == "step") return step(request);
  } catch (const CommandError& e) {
    return client_error(error_kind_to_string(e.kind()), e.what());
  }
  if (op.empty()) return client_error("BadRequest", "request is missing \"op\"");
  return client_error("BadRequest", "Unknown op: " + op);
}

std::string CommandApi::handle_line(const std::string& line) {
  json::Value request;
  try {
    request = json::parse(line);
  } catch (const std::exception& e) {
    return json::stringify(client_error("BadRequest", e.what()), 0);
  }
  return json::stringify(handle(request), 0);
}

json::Value CommandApi::health() const {
  json::Object o;
  o["ok"] = true;
  return o;
}

json::Value CommandApi::state(const json::Value& request) const {
  const json::Value* limit = request.find("event_limit");
  if (limit && !limit->is_null()) {
    const double n = limit->number_value(-1.0);
    if (!std::isfinite(n) || n < 0.0 || n > kMaxEventLimit || n != std::floor(n)) {
      return client_error("BadRequest", "event_limit must be an integer in [0, 1000000]");
    }
    return snapshot_to_json(service_.snapshot(static_cast<std::size_t>(n)));
  }
  return snapshot_to_json(service_.snapshot());
}

json::Value CommandApi::assign_task(const json::Value& request) {
  const std::string drone_id = request_drone_id(request);
  if (!service_.has_agent(drone_id)) {
    log::info("Rejected task for " + drone_id + ": unknown drone");
    throw unknown_drone_error(drone_id);
  }
  Task task = task_from_json(request_task(request));
  try {
    return assign_success(drone_id, service_.assign_task(drone_id, std::move(task)));
  } catch (const CommandError& e) {
    log::info("Rejected task for " + drone_id + ": " + e.what());
    throw;
  }
}

json::Value CommandApi::batch(const json::Value& request) {
  const json::Value* commands = request.find("commands");
  if (!commands || !commands->is_array()) throw invalid_task_error("batch requires a commands array");

  json::Array results;
  results.reserve(commands->array().size());
  for (const json::Value& item : commands->array()) {
    const std::string drone_id = item.find("drone_id") ? item.find("drone_id")->string_value() : std::string();
    try {
      if (drone_id.empty()) throw invalid_task_error("drone_id is required");
      if (!service_.has_agent(drone_id)) throw unknown_drone_error(drone_id);
      Task task = task_from_json(request_task(item));
      AssignResult res = service_.try_assign(drone_id, std::move(task));
      results.push_back(res.ok ? assign_success(drone_id, *res.assigned) : item_failure(drone_id, res.error));
    } catch (const CommandError& e) {
      results.push_back(item_failure(drone_id, e.what()));
    }
  }

  json::Object o;
  o["ok"] = true;
  o["results"] = std::move(results);
  return o;
}

json::Value CommandApi::cancel_task(const json::Value& request) {
  const std::string drone_id = request_drone_id(request);
  const std::optional<Task> prev = service_.cancel_task(drone_id);

  json::Object o;
  o["ok"] = true;
  o["drone_id"] = drone_id;
  o["cancelled"] = prev ? task_to_json(*prev) : json::Value(nullptr);
  return o;
}

json::Value CommandApi::step(const json::Value& request) {
  int ticks = 1;
  if (const json::Value* v = request.find("ticks"); v && !v->is_null()) {
    const double n = v->number_value(-1.0);
    if (n < 0.0 || n > kMaxStepTicks || n != std::floor(n)) {
      return client_error("BadRequest", "ticks must be an integer in [0, " + std::to_string(kMaxStepTicks) + "]");
    }
    ticks = static_cast<int>(n);
  }
  service_.step(ticks);
  const ClockReading now = service_.clock();

  json::Object o;
  o["ok"] = true;
  o["tick"] = static_cast<double>(now.tick);
  o["ts"] = now.time_s;
  return o;
}

int serve_lines(CommandApi& api, std::istream& in, std::ostream& out) {
  int answered = 0;
  std::string line;
  while (std::getline(in, line)) {
    const std::string trimmed = trim_copy(line);
    if (trimmed.empty() || trimmed[0] == '#') continue;

    json::Value response;
    bool quit = false;
    try {
      const json::Value request = json::parse(trimmed);
      const json::Value* op = request.find("op");
      quit = op && to_lower(op->string_value()) == "quit";
      response = quit ? api.health() : api.handle(request);
    } catch (const std::exception& e) {
      response = client_error("BadRequest", e.what());
    }

    out << json::stringify(response, 0) << '\n';
    out.flush();
    ++answered;
    if (quit) break;
  }
  return answered;
}

} // namespace dronefleet
