#pragma once
#include "../app_state.hpp"
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../game_state.hpp"
#include "../health.hpp"
#include "../pipeline.hpp"
#include "../systems/game_rules.hpp"
#include "../systems/hud.hpp"
#include <ecs/ecs.hpp>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// GameModule — the demo's rules on top of the toolbox modules.
//
// Creates the GameSession resource, adds GameRulesSystem to the Logic phase
// and HudSystem to the Render phase, and registers "Game" debug rows.
//
// Pipeline placement: after PhysicsModule and the collision / trigger
// modules (it consumes their pair events) and before HealthModule,
// TriggerModule::install_cleanup, DespawnModule and CleanupModule. HUD must
// be drawn before RenderModule::install_present.
// ---------------------------------------------------------------------------

struct GameModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline, GameSession session) {
        world.set_resource(std::move(session));
        pipeline.add_logic([](ecs::World& w, float dt) { GameRulesSystem::Update(w, dt); });
        pipeline.add_render([](ecs::World& w, float) { HudSystem::Update(w); });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Game", "State", [&world]() {
                auto* state = world.try_resource<State<GameState>>();
                return state ? std::string(to_string(state->current())) : std::string("-");
            });
            panel->watch("Game", "Health", [&world]() {
                std::string r = "-";
                world.each<PlayerTag, Health>([&](ecs::Entity, PlayerTag&, Health& h) {
                    char b[32];
                    std::snprintf(b, sizeof(b), "%.0f / %.0f", h.get(), h.max());
                    r = b;
                });
                return r;
            });
            panel->watch("Game", "Deaths", [&world]() {
                auto* s = world.try_resource<GameSession>();
                return s ? std::to_string(s->deaths) : std::string("-");
            });
        }
    }
};
