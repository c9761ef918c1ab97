#pragma once
#include "../game_state.hpp"
#include <ecs/ecs.hpp>
#include <ecs/modules/transform.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Per-run settings and counters of the demo (World resource).
struct GameSession {
    std::string scene_path = "resources/scenes/arena.json";
    float hazard_interval = 2.0f;
    float hazard_lifetime = 6.0f;
    float move_speed = 6.0f;
    float arena_half_size = 9.0f;   // hazards drop inside [-h, h] on x and z

    float hazard_timer = 0.0f;
    uint32_t rng = 0x2545F491u;
    int deaths = 0;
    bool exit_requested = false;
};

// ---------------------------------------------------------------------------
// GameRulesSystem — Logic phase, after the collision pair systems and
// before RangeSystem / DespawnSystem / CleanupSystem.
//
//   1. Entering InGame spawns the arena scene.
//   2. Mapped actions steer the player (MoveIntent) and drive Restart,
//      ToggleSbs, ToggleDebug and Exit.
//   3. Player contacts with Hazard / Pickup change its Health.
//   4. A DeathEvent on the player requests GameOver.
//   5. While InGame, a hazard is dropped every hazard_interval seconds.
//   6. Cameras follow the player.
// ---------------------------------------------------------------------------

class GameRulesSystem {
public:
    static void Update(ecs::World& world, float dt);

    static void spawn_arena(ecs::World& world);
    static void apply_actions(ecs::World& world);
    static void apply_contacts(ecs::World& world);
    static void check_death(ecs::World& world);
    static void spawn_hazards(ecs::World& world, float dt);
    static void follow_player(ecs::World& world);

    // Horizontal (x, z) velocity for this frame's movement actions. Pure.
    static ecs::Vec2 move_velocity(const std::vector<GameAction>& actions, float speed);

    // Uniform value in [0, 1); advances state (xorshift32). Pure.
    static float next_random(uint32_t& state);
};
