#include "dronefleet/util/log.h"

#include <atomic>
#include <iostream>
#include <mutex>
#include <utility>

#include "dronefleet/util/strings.h"

namespace dronefleet::log {
namespace {

std::mutex g_mu;
std::atomic<Level> g_level{Level::Info};
Sink g_sink;

void emit(Level l, const std::string& msg) {
  const Level threshold = g_level.load(std::memory_order_relaxed);
  if (threshold == Level::Off || l < threshold) return;
  std::lock_guard<std::mutex> lock(g_mu);
  if (g_sink) {
    g_sink(l, msg);
    return;
  }
  std::cerr << "[" << level_label(l) << "] " << msg << "\n";
}

} // namespace

void set_level(Level lvl) { g_level.store(lvl, std::memory_order_relaxed); }
Level level() { return g_level.load(std::memory_order_relaxed); }

bool parse_level(const std::string& text, Level& out) {
  const std::string s = to_lower(trim_copy(text));
  if (s == "debug") {
    out = Level::Debug;
  } else if (s == "info") {
    out = Level::Info;
  } else if (s == "warn" || s == "warning") {
    out = Level::Warn;
  } else if (s == "error") {
    out = Level::Error;
  } else if (s == "off" || s == "none") {
    out = Level::Off;
  } else {
    return false;
  }
  return true;
}

const char* level_label(Level l) {
  switch (l) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    case Level::Off: return "OFF";
  }
  return "";
}

void set_sink(Sink sink) {
  std::lock_guard<std::mutex> lock(g_mu);
  g_sink = std::move(sink);
}

void debug(const std::string& msg) { emit(Level::Debug, msg); }
void info(const std::string& msg) { emit(Level::Info, msg); }
void warn(const std::string& msg) { emit(Level::Warn, msg); }
void error(const std::string& msg) { emit(Level::Error, msg); }

} // namespace dronefleet::log
