#include "hud.hpp"
#include "game_rules.hpp"
#include "../app_state.hpp"
#include "../components.hpp"
#include "../game_assets.hpp"
#include "../game_state.hpp"
#include "../health.hpp"
#include "../loading.hpp"
#include <raylib.h>
#include <cstdio>

using namespace ecs;

static void draw_loading(World& world, int width, int height) {
    const auto* loader = world.try_resource<AssetLoader<GameTextures, GameState>>();
    if (!loader) return;

    if (loader->is_failed()) {
        const auto& failed = std::get<loading::Failed>(loader->phase);
        char b[256];
        std::snprintf(b, sizeof(b), "Failed to load '%s' (%s)", failed.slot.c_str(), failed.path.c_str());
        DrawText(b, 40, height / 2, 20, RED);
        return;
    }

    const auto* tally = world.try_resource<LoadingProgress<GameState>>();
    const size_t total = tally ? tally->total(GameState::Loading) : loader->total();
    const size_t loaded = tally ? tally->loaded(GameState::Loading) : loader->loaded();
    const float progress = total == 0 ? 1.0f
        : static_cast<float>(loaded) / static_cast<float>(total);
    const int bar_w = width - 80;
    DrawText("LOADING", 40, height / 2 - 40, 30, LIGHTGRAY);
    DrawRectangleLines(40, height / 2, bar_w, 20, GRAY);
    DrawRectangle(42, height / 2 + 2, static_cast<int>((bar_w - 4) * progress), 16, SKYBLUE);
}

static void draw_in_game(World& world) {
    world.each<PlayerTag, Health>([&](Entity, PlayerTag&, Health& health) {
        char b[64];
        std::snprintf(b, sizeof(b), "HEALTH %.0f / %.0f", health.get(), health.max());
        DrawText(b, 10, 10, 20, health.get() < health.max() * 0.3f ? RED : LIME);
    });
    DrawText("WASD: Move | TAB: Toggle SBS | F3: Debug | ESC: Quit", 10, 36, 20, LIGHTGRAY);
}

void HudSystem::Update(World& world) {
    const auto* state = world.try_resource<State<GameState>>();
    if (!state) return;

    const int width = GetScreenWidth();
    const int height = GetScreenHeight();

    switch (state->current()) {
        case GameState::Loading:
            draw_loading(world, width, height);
            break;
        case GameState::InGame:
            draw_in_game(world);
            break;
        case GameState::GameOver: {
            const char* msg = "GAME OVER - press R to restart";
            DrawText(msg, (width - MeasureText(msg, 30)) / 2, height / 2 - 15, 30, RED);
            if (const auto* session = world.try_resource<GameSession>()) {
                char b[32];
                std::snprintf(b, sizeof(b), "Deaths: %d", session->deaths);
                DrawText(b, (width - MeasureText(b, 20)) / 2, height / 2 + 25, 20, LIGHTGRAY);
            }
            break;
        }
    }
}
