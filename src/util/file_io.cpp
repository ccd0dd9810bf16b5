#include "dronefleet/util/file_io.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace dronefleet {
namespace {

namespace fs = std::filesystem;

fs::path resolve_read_path(const fs::path& requested) {
  std::error_code ec;
  if (requested.empty() || requested.is_absolute() || fs::exists(requested, ec)) return requested;
#ifdef DRONEFLEET_SOURCE_DIR
  const fs::path candidate = fs::path(DRONEFLEET_SOURCE_DIR) / requested;
  ec.clear();
  if (fs::exists(candidate, ec) && !ec) return candidate;
#endif
  return requested;
}

// Removes the temporary file unless the write committed.
class TempFile {
 public:
  explicit TempFile(fs::path p) : path_(std::move(p)) {}
  ~TempFile() {
    if (!committed_) {
      std::error_code ec;
      fs::remove(path_, ec);
    }
  }
  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  const fs::path& path() const { return path_; }
  void commit() { committed_ = true; }

 private:
  fs::path path_;
  bool committed_{false};
};

} // namespace

std::string read_text_file(const std::string& path) {
  const fs::path resolved = resolve_read_path(fs::path(path));
  std::ifstream in(resolved, std::ios::in | std::ios::binary);
  if (!in) throw std::runtime_error("Failed to open file for reading: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_text_file(const std::string& path, const std::string& contents) {
  const fs::path target(path);
  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) throw std::runtime_error("Failed to create directory for " + path + " (" + ec.message() + ")");
  }

  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  TempFile tmp(fs::path(path + ".tmp." + std::to_string(stamp)));
  {
    std::ofstream out(tmp.path(), std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + tmp.path().string());
    out << contents;
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + tmp.path().string());
  }

  fs::rename(tmp.path(), target, ec);
  if (ec) throw std::runtime_error("Failed to replace file: " + path + " (" + ec.message() + ")");
  tmp.commit();
}

} // namespace dronefleet
