#pragma once

#include <string>

namespace dronefleet {

// Reads an entire file. Relative paths that do not exist under the working
// directory are also looked up under the source tree (DRONEFLEET_SOURCE_DIR),
// so the bundled data/ files work when running from a build directory.
// Throws std::runtime_error on failure.
std::string read_text_file(const std::string& path);

// Writes via a temporary sibling file + rename so an interrupted write never
// leaves a truncated file behind. Creates parent directories.
void write_text_file(const std::string& path, const std::string& contents);

} // namespace dronefleet
