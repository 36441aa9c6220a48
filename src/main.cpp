#include "config.hpp"
#include "pipeline.hpp"
#include "modules/audio_module.hpp"
#include "modules/board_module.hpp"
#include "modules/core_module.hpp"
#include "modules/event_bus_module.hpp"
#include "modules/input_module.hpp"
#include "modules/render_module.hpp"
#include "modules/status_module.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <exception>
#include <filesystem>
#include <string>

static const char* DEFAULT_CONFIG_PATH = "config/bardbox.json";

static void shutdown(ecs::World& world) {
  RenderModule::shutdown(world);
  CoreModule::shutdown(world);
  AudioModule::shutdown();
}

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : DEFAULT_CONFIG_PATH;

  AppConfig config;
  if (std::filesystem::exists(config_path)) {
    if (!ConfigLoader::load(config, config_path)) {
      TraceLog(LOG_ERROR, "CONFIG: Invalid config file %s", config_path.c_str());
      return 1;
    }
  } else {
    TraceLog(LOG_INFO, "CONFIG: %s not found, using defaults", config_path.c_str());
  }
  SetTraceLogLevel(config.trace_log_level());

  SetConfigFlags(FLAG_WINDOW_RESIZABLE);
  InitWindow(config.window_width, config.window_height, config.title.c_str());
  SetExitKey(KEY_NULL); // ESC cancels prompts instead of closing
  SetTargetFPS(60);

  ecs::World world;
  ecs::Pipeline pipeline;

  // --- Module Setup ---
  // Order matters: EventBus first (flush leads Pre-Update), Status before
  // any module adding rows, Audio before Core (backend needs the device),
  // Input before Board (InputRecord before BoardInput), Present last.
  try {
    EventBusModule::install(world, pipeline);
    StatusModule::install(world, pipeline);
    AudioModule::install(world, pipeline);
    CoreModule::install(world, config);
    InputModule::install(world, pipeline);
    BoardModule::install(world, pipeline);
    RenderModule::install(world, pipeline);
    StatusModule::install_overlay(world, pipeline);
    RenderModule::install_present(world, pipeline);
  } catch (const std::exception& e) {
    TraceLog(LOG_ERROR, "STARTUP: %s", e.what());
    shutdown(world);
    CloseWindow();
    return 1;
  }

  // --- Main Loop ---
  while (!WindowShouldClose()) {
    float dt = GetFrameTime();

    // 1. Input & Commands
    pipeline.update(world, dt);

    // 2. Feed the music stream
    pipeline.pump_audio(world, dt);

    // 3. Render
    pipeline.render(world);
  }

  shutdown(world);
  CloseWindow();
  return 0;
}
