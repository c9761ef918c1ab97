#include "components.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "game_assets.hpp"
#include "game_state.hpp"
#include "input_mapping.hpp"
#include "pipeline.hpp"
#include "modules/collision_module.hpp"
#include "modules/debug_module.hpp"
#include "modules/despawn_module.hpp"
#include "modules/event_bus_module.hpp"
#include "modules/game_module.hpp"
#include "modules/input_module.hpp"
#include "modules/loading_module.hpp"
#include "modules/physics_module.hpp"
#include "modules/range_module.hpp"
#include "modules/render_module.hpp"
#include "modules/split_screen_module.hpp"
#include "modules/state_module.hpp"
#include "systems/keyboard.hpp"
#include "texture_server.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <iostream>
#include <memory>
#include <string>

static const char* CONFIG_PATH = "resources/config/toolbox.json";

// Used when the config file has no "input" section.
static InputMapping<GameAction> default_mapping() {
  return {
      {UserInput::pressed(KEY_W),   GameAction::MoveForward},
      {UserInput::pressed(KEY_UP),  GameAction::MoveForward},
      {UserInput::pressed(KEY_S),   GameAction::MoveBack},
      {UserInput::pressed(KEY_DOWN), GameAction::MoveBack},
      {UserInput::pressed(KEY_A),   GameAction::MoveLeft},
      {UserInput::pressed(KEY_LEFT), GameAction::MoveLeft},
      {UserInput::pressed(KEY_D),   GameAction::MoveRight},
      {UserInput::pressed(KEY_RIGHT), GameAction::MoveRight},
      {UserInput::down(KEY_R),      GameAction::Restart},
      {UserInput::down(KEY_TAB),    GameAction::ToggleSbs},
      {UserInput::down(KEY_F3),     GameAction::ToggleDebug},
      {UserInput::up(KEY_ESCAPE),   GameAction::Exit},
  };
}

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : CONFIG_PATH;

  AppConfig config;
  InputMapping<GameAction> mapping;
  LoadingManifest<GameTextures> manifest = game_texture_manifest();
  try {
    config = ConfigLoader::load(config_path);
    mapping = build_input_mapping<GameAction>(config.bindings, KeyNames::lookup, parse_game_action);
    for (const auto& [slot, path] : config.assets) manifest.set_path(slot, path);
  } catch (const ConfigError& e) {
    std::cerr << "[Config] " << e.what() << std::endl;
    return 1;
  }
  if (mapping.empty()) mapping = default_mapping();

  SetConfigFlags(FLAG_WINDOW_RESIZABLE);
  InitWindow(config.window.width, config.window.height, config.window.title.c_str());
  SetExitKey(KEY_NULL);
  SetTargetFPS(60);

  ecs::World world;
  ecs::Pipeline pipeline;

  // --- Module installation (order = execution order within each phase) ---
  EventBusModule::install(world, pipeline);
  StateModule<GameState>::install(world, pipeline, GameState::Loading);
  InputModule::install(world, pipeline);
  InputMappingModule<GameAction>::install(world, pipeline, std::move(mapping));
  RenderModule::install(world, pipeline);
  DebugModule::install(world, pipeline);

  auto textures = world.resource<std::shared_ptr<TextureAssetServer>>();
  LoadingModule<GameTextures, GameState>::install(world, pipeline, textures, std::move(manifest),
                                                  GameState::Loading, GameState::InGame);

  PhysicsModule::install(world, pipeline);
  CollisionDetectionModule<PlayerTag, Hazard>::install(world, pipeline);
  TriggerModule<PlayerTag, Pickup>::install(world, pipeline);

  GameSession session;
  session.scene_path = config.scene_path;
  session.hazard_interval = config.hazard_interval;
  session.hazard_lifetime = config.hazard_lifetime;
  GameModule::install(world, pipeline, std::move(session));

  HealthModule::install(world, pipeline);
  TriggerModule<PlayerTag, Pickup>::install_cleanup(world, pipeline);
  DespawnModule::install(world, pipeline);
  CleanupModule<GameState>::install(world, pipeline);

  switch (config.view_mode) {
    case ViewMode::Split:
      SplitScreenModule::install(world, pipeline);
      break;
    case ViewMode::Sbs:
      SbsModule::install(world, pipeline, config.sbs_gap, SbsRig::Mode::Sbs);
      break;
    case ViewMode::Single:
      SbsModule::install(world, pipeline, config.sbs_gap, SbsRig::Mode::Deactivated);
      break;
  }

  RenderModule::install_present(world, pipeline);

  // --- Main Loop ---
  float accumulator = 0.0f;
  const float fixed_dt = 1.0f / 60.0f;

  while (!WindowShouldClose() && !world.resource<GameSession>().exit_requested) {
    float dt = GetFrameTime();

    // 1. Update Logic & Input
    pipeline.update(world, dt);

    // 2. Step Physics (Fixed Timestep)
    accumulator += dt;
    while (accumulator >= fixed_dt) {
        pipeline.step_physics(world, fixed_dt);
        accumulator -= fixed_dt;
    }

    // 3. Render
    pipeline.render(world);
  }

  RenderModule::shutdown(world);
  CloseWindow();
  return 0;
}
