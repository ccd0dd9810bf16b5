#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "dronefleet/util/file_io.h"

#define DF_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_file_io() {
  namespace fs = std::filesystem;

  struct CwdGuard {
    fs::path saved;
    explicit CwdGuard(fs::path p) : saved(std::move(p)) {}
    ~CwdGuard() {
      std::error_code ec_restore;
      fs::current_path(saved, ec_restore);
    }
  };

  std::error_code ec;
  fs::path dir = fs::temp_directory_path(ec);
  if (ec || dir.empty()) dir = fs::path(".");

  const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
  dir /= "dronefleet_test_file_io";
  dir /= std::to_string(static_cast<long long>(nonce));

  fs::create_directories(dir, ec);
  DF_ASSERT(!ec);

  const fs::path target = dir / "nested" / "state.json";

  // Parent directories are created on demand.
  dronefleet::write_text_file(target.string(), "{\"ts\": 0}\n");
  DF_ASSERT(dronefleet::read_text_file(target.string()) == "{\"ts\": 0}\n");

  dronefleet::write_text_file(target.string(), "{\"ts\": 1}\n");
  DF_ASSERT(dronefleet::read_text_file(target.string()) == "{\"ts\": 1}\n");

  // Bundled data resolves from outside the source tree too.
  const fs::path old_cwd = fs::current_path(ec);
  DF_ASSERT(!ec);
  {
    CwdGuard cwd_guard(old_cwd);
    fs::current_path(dir, ec);
    DF_ASSERT(!ec);

    const std::string cfg = dronefleet::read_text_file("data/config/default.json");
    DF_ASSERT(cfg.find("\"tick_seconds\"") != std::string::npos);
  }

  bool threw = false;
  try {
    (void)dronefleet::read_text_file((dir / "does_not_exist.json").string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  DF_ASSERT(threw);

  // No temp siblings are left behind.
  const std::string tmp_prefix = target.filename().string() + ".tmp";
  for (const auto& entry : fs::directory_iterator(target.parent_path())) {
    const std::string name = entry.path().filename().string();
    DF_ASSERT(name.rfind(tmp_prefix, 0) != 0);
  }

  fs::remove_all(dir, ec);
  return 0;
}
