#include "game_rules.hpp"
#include "cleanup.hpp"
#include "collision.hpp"
#include "split_screen.hpp"
#include "../app_state.hpp"
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../events.hpp"
#include "../health.hpp"
#include "../input_mapping.hpp"
#include "../math_util.hpp"
#include "../scene.hpp"
#include <ecs/modules/transform.hpp>
#include <cmath>
#include <iostream>
#include <vector>

using namespace ecs;

void GameRulesSystem::Update(World& world, float dt) {
    spawn_arena(world);
    apply_actions(world);
    apply_contacts(world);
    check_death(world);
    spawn_hazards(world, dt);
    follow_player(world);
}

void GameRulesSystem::spawn_arena(World& world) {
    if (!entered_state(world, GameState::InGame)) return;
    auto* session = world.try_resource<GameSession>();
    if (!session) return;

    session->hazard_timer = 0.0f;
    const std::string path = session->scene_path;
    if (!SceneLoader::load(world, path)) {
        std::cerr << "[Game] Could not load arena " << path << std::endl;
        if (auto* s = world.try_resource<GameSession>()) s->exit_requested = true;
        return;
    }
    std::cout << "[Game] Arena loaded from " << path << std::endl;
}

ecs::Vec2 GameRulesSystem::move_velocity(const std::vector<GameAction>& actions, float speed) {
    float x = 0.0f, z = 0.0f;
    for (auto a : actions) {
        switch (a) {
            case GameAction::MoveForward: z -= 1.0f; break;
            case GameAction::MoveBack:    z += 1.0f; break;
            case GameAction::MoveLeft:    x -= 1.0f; break;
            case GameAction::MoveRight:   x += 1.0f; break;
            default: break;
        }
    }
    float len = std::sqrt(x * x + z * z);
    if (len < 0.0001f) return {0.0f, 0.0f};
    return {x / len * speed, z / len * speed};
}

void GameRulesSystem::apply_actions(World& world) {
    std::vector<GameAction> actions;
    if (const auto* q = world.try_resource<Events<ActionEvent<GameAction>>>()) {
        for (const auto& ev : q->read()) actions.push_back(ev.action);
    }

    float speed = 6.0f;
    if (auto* session = world.try_resource<GameSession>()) speed = session->move_speed;
    const ecs::Vec2 velocity = move_velocity(actions, speed);
    world.each<PlayerTag, MoveIntent>([&](Entity, PlayerTag&, MoveIntent& intent) {
        intent.velocity = velocity;
    });

    auto* state = world.try_resource<State<GameState>>();
    for (auto a : actions) {
        switch (a) {
            case GameAction::Restart:
                if (state && state->is(GameState::GameOver)) state->set(GameState::InGame);
                break;
            case GameAction::ToggleSbs:
                if (auto* rig = world.try_resource<SbsRig>()) SbsSystem::toggle(*rig);
                break;
            case GameAction::ToggleDebug:
                if (auto* panel = world.try_resource<DebugPanel>()) panel->toggle();
                break;
            case GameAction::Exit:
                if (auto* session = world.try_resource<GameSession>()) session->exit_requested = true;
                break;
            default:
                break;
        }
    }
}

void GameRulesSystem::apply_contacts(World& world) {
    if (const auto* hits = world.try_resource<Events<CollisionPairStarted<PlayerTag, Hazard>>>()) {
        for (const auto& ev : hits->read()) {
            const auto* hazard = world.try_get<Hazard>(ev.second);
            if (hazard) HealthSystem::modify(world, ev.first, -hazard->damage);
        }
    }
    if (const auto* grabs = world.try_resource<Events<CollisionPairStarted<PlayerTag, Pickup>>>()) {
        for (const auto& ev : grabs->read()) {
            const auto* pickup = world.try_get<Pickup>(ev.second);
            if (pickup) HealthSystem::modify(world, ev.first, pickup->heal);
        }
    }
}

void GameRulesSystem::check_death(World& world) {
    const auto* deaths = world.try_resource<Events<DeathEvent>>();
    auto* state = world.try_resource<State<GameState>>();
    if (!deaths || !state || !state->is(GameState::InGame)) return;

    for (const auto& ev : deaths->read()) {
        if (!world.has<PlayerTag>(ev.entity)) continue;
        if (auto* session = world.try_resource<GameSession>()) session->deaths++;
        std::cout << "[Game] Player died" << std::endl;
        state->set(GameState::GameOver);
        return;
    }
}

float GameRulesSystem::next_random(uint32_t& state) {
    if (state == 0) state = 0x2545F491u;
    state ^= state << 13;
    state ^= state >> 17;
    state ^= state << 5;
    return static_cast<float>(state >> 8) / 16777216.0f;
}

void GameRulesSystem::spawn_hazards(World& world, float dt) {
    auto* state = world.try_resource<State<GameState>>();
    auto* session = world.try_resource<GameSession>();
    if (!state || !session || !state->is(GameState::InGame)) return;

    session->hazard_timer += dt;
    if (session->hazard_timer < session->hazard_interval) return;
    session->hazard_timer -= session->hazard_interval;

    const float h = session->arena_half_size;
    const float x = (next_random(session->rng) * 2.0f - 1.0f) * h;
    const float z = (next_random(session->rng) * 2.0f - 1.0f) * h;
    const ecs::Vec3 size = {0.8f, 0.8f, 0.8f};

    world.deferred().create_with(
        ecs::LocalTransform{{x, 12.0f, z}, {0,0,0,1}, size},
        ecs::WorldTransform{},
        MeshRenderer{ShapeType::Box, Colors::Maroon},
        BoxCollider{{size.x * 0.5f, size.y * 0.5f, size.z * 0.5f}},
        Hazard{},
        AutoDespawn::after_seconds(session->hazard_lifetime),
        Cleanup<GameState>{GameState::InGame},
        WorldTag{},
        RigidBodyConfig{BodyType::Dynamic, 2.0f}
    );
}

void GameRulesSystem::follow_player(World& world) {
    bool found = false;
    ecs::Vec3 player = {0, 0, 0};
    world.each<PlayerTag, WorldTransform>([&](Entity, PlayerTag&, WorldTransform& wt) {
        player = {wt.matrix.m[12], wt.matrix.m[13], wt.matrix.m[14]};
        found = true;
    });
    if (!found) return;

    namespace vm = toolbox::math;
    const ecs::Vec3 chase = {0.0f, 8.0f, 14.0f};

    // The stereo rig owns both cameras when it is installed.
    if (auto* rig = world.try_resource<SbsRig>()) {
        rig->position = vm::add(player, chase);
        rig->target = player;
        return;
    }

    world.each<CameraView, LeftCamera>([&](Entity, CameraView& view, LeftCamera&) {
        view.position = vm::add(player, chase);
        view.target = player;
    });
    world.each<CameraView, RightCamera>([&](Entity, CameraView& view, RightCamera&) {
        view.position = vm::add(player, {0.0f, 22.0f, 0.5f});
        view.target = player;
    });
}
