#include <iostream>
#include <string_view>

#ifndef DRONEFLEET_VERSION
#define DRONEFLEET_VERSION "unknown"
#endif

#ifndef DRONEFLEET_UI_UNAVAILABLE_REASON
#define DRONEFLEET_UI_UNAVAILABLE_REASON "UI dependencies are unavailable in this build."
#endif

namespace {

constexpr const char* kStatusCodeUiUnavailable = "DF-UI-001";
constexpr const char* kStatusCodeUiRequiredUnavailable = "DF-UI-002";
constexpr int kExitCodeOk = 0;
constexpr int kExitCodeUiRequiredUnavailable = 2;

bool has_flag(int argc, char** argv, std::string_view flag) {
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    if (!arg) continue;
    if (flag == arg) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  const char* name = (exe && *exe) ? exe : "dronefleet";
  std::cout << "DroneFleet viewer launcher v" << DRONEFLEET_VERSION << "\n\n";
  std::cout << "Usage: " << name << " [--help] [--version] [--require-ui]\n\n";
  std::cout << "This build does not include the interactive map viewer.\n";
  std::cout << "Reason: " << DRONEFLEET_UI_UNAVAILABLE_REASON << "\n\n";
  std::cout << "To run the fleet simulation in this build, use:\n";
  std::cout << "  dronefleet_cli --scenario demo --ticks 300\n";
  std::cout << "  dronefleet_cli --serve            (JSON requests on stdin)\n\n";
  std::cout << "To build the viewer, install SDL2 and Dear ImGui (with its SDL2 and\n";
  std::cout << "SDL_Renderer2 backends) where CMake's find_package can see them.\n";
  std::cout << "\nLauncher status codes:\n";
  std::cout << "  " << kStatusCodeUiUnavailable << " (exit " << kExitCodeOk
            << "): viewer unavailable; informational fallback launch.\n";
  std::cout << "  " << kStatusCodeUiRequiredUnavailable << " (exit " << kExitCodeUiRequiredUnavailable
            << "): viewer explicitly required via --require-ui but unavailable.\n";
}

} // namespace

int main(int argc, char** argv) {
  if (has_flag(argc, argv, "--version")) {
    std::cout << DRONEFLEET_VERSION << "\n";
    return 0;
  }

  if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
    print_usage(argv[0]);
    return 0;
  }

  if (has_flag(argc, argv, "--require-ui")) {
    std::cerr << "[" << kStatusCodeUiRequiredUnavailable << "] DroneFleet viewer is unavailable in this build.\n";
    std::cerr << "Reason: " << DRONEFLEET_UI_UNAVAILABLE_REASON << "\n";
    return kExitCodeUiRequiredUnavailable;
  }

  std::cerr << "[" << kStatusCodeUiUnavailable << "] DroneFleet viewer is unavailable in this build.\n";
  std::cerr << "Reason: " << DRONEFLEET_UI_UNAVAILABLE_REASON << "\n";
  std::cerr << "Run with --help for details.\n";
  return kExitCodeOk;
}
