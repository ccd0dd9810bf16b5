#include <SDL.h>

#include <cstdint>
#include <exception>
#include <string>
#include <utility>

#include <imgui.h>
#include <imgui_impl_sdl2.h>
#include <imgui_impl_sdlrenderer2.h>

#include "dronefleet/util/log.h"

#include "dronefleet/core/scenario.h"
#include "dronefleet/core/sim_config.h"
#include "ui/app.h"

namespace {

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

} // namespace

int main(int argc, char** argv) {
  try {
    dronefleet::log::set_level(dronefleet::log::Level::Info);

    const std::string scenario = get_str_arg(argc, argv, "--scenario", "default");
    const std::string config_path = get_str_arg(argc, argv, "--config", "");
    const int seed = std::stoi(get_str_arg(argc, argv, "--seed", "1"));

    dronefleet::World world;
    if (scenario == "default") {
      world = dronefleet::make_default_scenario(static_cast<std::uint32_t>(seed));
    } else if (scenario == "demo") {
      world = dronefleet::make_demo_scenario();
    } else {
      world = dronefleet::load_scenario_from_file(scenario);
    }
    const dronefleet::SimConfig cfg =
        config_path.empty() ? dronefleet::SimConfig{} : dronefleet::load_sim_config_from_file(config_path);

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
      dronefleet::log::error(std::string("SDL_Init failed: ") + SDL_GetError());
      return 1;
    }

    SDL_Window* window = SDL_CreateWindow("DroneFleet", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 1280, 720,
                                          SDL_WINDOW_RESIZABLE);
    if (!window) {
      dronefleet::log::error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
      return 1;
    }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) {
      dronefleet::log::error(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
      return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();

    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    ImGui_ImplSDL2_InitForSDLRenderer(window, renderer);
    ImGui_ImplSDLRenderer2_Init(renderer);

    {
      // The app owns the clock thread; it must stop before ImGui shuts down.
      dronefleet::ui::App app(std::move(world), cfg);

      bool running = true;
      while (running) {
        SDL_Event e;
        while (SDL_PollEvent(&e)) {
          ImGui_ImplSDL2_ProcessEvent(&e);
          if (e.type == SDL_QUIT) running = false;
          if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_CLOSE &&
              e.window.windowID == SDL_GetWindowID(window))
            running = false;
          app.on_event(e);
        }

        ImGui_ImplSDLRenderer2_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        app.frame();

        ImGui::Render();
        SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
        SDL_RenderClear(renderer);
        ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
        SDL_RenderPresent(renderer);
      }
    }

    ImGui_ImplSDLRenderer2_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
  } catch (const std::exception& e) {
    dronefleet::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
