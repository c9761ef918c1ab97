#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/app_state.hpp"
#include "../src/components.hpp"
#include "../src/config.hpp"
#include "../src/debug_panel.hpp"
#include "../src/errors.hpp"
#include "../src/events.hpp"
#include "../src/game_assets.hpp"
#include "../src/game_state.hpp"
#include "../src/health.hpp"
#include "../src/pipeline.hpp"
#include "../src/input_mapping.hpp"
#include "../src/scene.hpp"
#include "../src/systems/cleanup.hpp"
#include "../src/systems/collision.hpp"
#include "../src/systems/game_rules.hpp"
#include <ecs/ecs.hpp>
#include <ecs/modules/transform.hpp>

// Everything here is engine-free: no Jolt, no raylib. Physics and rendering
// are exercised by running the demo.

using Catch::Matchers::WithinAbs;

// ---------------------------------------------------------------------------
// Events<T> / EventRegistry
// ---------------------------------------------------------------------------

struct TestEvent { int value; };

TEST_CASE("Events — send and read", "[events]") {
    Events<TestEvent> queue;
    CHECK(queue.empty());
    CHECK(queue.read().empty());

    queue.send({42});
    queue.send({7});

    CHECK_FALSE(queue.empty());
    REQUIRE(queue.read().size() == 2);
    CHECK(queue.read()[0].value == 42);
    CHECK(queue.read()[1].value == 7);
}

TEST_CASE("Events — clear empties the queue", "[events]") {
    Events<TestEvent> queue;
    queue.send({1});
    queue.send({2});
    queue.clear();
    CHECK(queue.empty());
}

TEST_CASE("EventRegistry — flush_all clears every registered queue", "[events]") {
    ecs::World world;
    world.set_resource(EventRegistry{});
    auto& reg = world.resource<EventRegistry>();
    reg.register_queue<TestEvent>(world);
    reg.register_queue<WindowResized>(world);

    send_event(world, TestEvent{1});
    send_event(world, WindowResized{640, 480});
    world.resource<EventRegistry>().flush_all();

    CHECK(world.resource<Events<TestEvent>>().empty());
    CHECK(world.resource<Events<WindowResized>>().empty());
}

TEST_CASE("EventRegistry — registering twice keeps one queue and its events", "[events]") {
    ecs::World world;
    world.set_resource(EventRegistry{});
    world.resource<EventRegistry>().register_queue<TestEvent>(world);
    send_event(world, TestEvent{5});

    world.resource<EventRegistry>().register_queue<TestEvent>(world);

    CHECK(world.resource<EventRegistry>().queue_count() == 1);
    CHECK(world.resource<Events<TestEvent>>().read().size() == 1);
}

TEST_CASE("send_event — no-op without a registered queue", "[events]") {
    ecs::World world;
    send_event(world, TestEvent{1});
    CHECK(world.try_resource<Events<TestEvent>>() == nullptr);
}

// ---------------------------------------------------------------------------
// Pipeline
// ---------------------------------------------------------------------------

TEST_CASE("Pipeline — startup once, then pre-update before logic", "[pipeline]") {
    ecs::World world;
    ecs::Pipeline pipeline;
    std::string trace;
    pipeline.add_logic([&](ecs::World&, float) { trace += "L"; });
    pipeline.add_pre_update([&](ecs::World&, float) { trace += "P"; });
    pipeline.add_startup([&](ecs::World&, float) { trace += "S"; });
    pipeline.add_physics([&](ecs::World&, float) { trace += "F"; });

    pipeline.update(world, 0.016f);
    pipeline.update(world, 0.016f);
    pipeline.step_physics(world, 0.016f);

    CHECK(trace == "SPLPLF");
    CHECK(pipeline.system_count() == 4);
}

// ---------------------------------------------------------------------------
// DebugPanel
// ---------------------------------------------------------------------------

TEST_CASE("DebugPanel — watch creates section and row", "[debug]") {
    DebugPanel panel;
    panel.watch("Engine", "FPS", []() { return std::string("60"); });

    REQUIRE(panel.sections().size() == 1);
    CHECK(panel.sections()[0].title == "Engine");
    REQUIRE(panel.sections()[0].rows.size() == 1);
    CHECK(panel.sections()[0].rows[0].fn() == "60");
}

TEST_CASE("DebugPanel — same label replaces the provider", "[debug]") {
    DebugPanel panel;
    panel.watch("Game", "State", []() { return std::string("Loading"); });
    panel.watch("Game", "State", []() { return std::string("InGame"); });

    REQUIRE(panel.sections()[0].rows.size() == 1);
    CHECK(panel.sections()[0].rows[0].fn() == "InGame");
}

TEST_CASE("DebugPanel — snapshot evaluates rows in section order", "[debug]") {
    int entities = 3;
    DebugPanel panel;
    panel.watch("Engine", "Entities", [&entities]() { return std::to_string(entities); });
    panel.watch("Game",   "State",    []() { return std::string("InGame"); });
    panel.watch("Engine", "FPS",      []() { return std::string("60"); });

    entities = 9;
    auto lines = panel.snapshot();
    REQUIRE(lines.size() == 3);
    CHECK(lines[0].section == "Engine");
    CHECK(lines[0].value == "9");
    CHECK(lines[1].label == "FPS");
    CHECK(lines[2].section == "Game");
}

TEST_CASE("DebugPanel — hidden by default, toggle flips", "[debug]") {
    DebugPanel panel;
    CHECK_FALSE(panel.visible);
    panel.toggle();
    CHECK(panel.visible);
    panel.toggle();
    CHECK_FALSE(panel.visible);
}

// ---------------------------------------------------------------------------
// SceneLoader
// ---------------------------------------------------------------------------

static const char* ARENA_SCENE = R"({
  "entities": [
    {
      "transform": { "position": [1.0, 2.0, 3.0], "rotation": [0,0,0,1], "scale": [4.0, 5.0, 6.0] },
      "mesh": { "shape": "Box", "color": [0.5, 0.5, 0.5, 1.0] },
      "box_collider": { "half_extents": [2.0, 2.5, 3.0] },
      "rigid_body": { "type": "Static" },
      "cleanup": "InGame",
      "tags": ["World"]
    },
    {
      "transform": { "position": [0.0, 1.0, 0.0] },
      "mesh": { "shape": "Sphere" },
      "sphere_collider": { "radius": 0.5 },
      "rigid_body": { "type": "Dynamic", "mass": 70.0 },
      "health": { "min": 0, "max": 80, "current": 60, "regen": 2.0, "quantize": 1.0 },
      "sprite": { "texture": "ducky", "size": 1.5 },
      "tags": ["Player", "World"]
    },
    {
      "transform": { "position": [4.0, 0.5, 0.0] },
      "box_collider": { "half_extents": [0.5, 0.5, 0.5] },
      "rigid_body": { "type": "Static", "sensor": true },
      "pickup": { "heal": 30 },
      "tags": ["Trigger"]
    },
    {
      "hazard": { "damage": 15 },
      "auto_despawn": { "frames": 3 }
    }
  ]
})";

TEST_CASE("SceneLoader — correct entity count", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, ARENA_SCENE));
    CHECK(world.count() == 4);
}

TEST_CASE("SceneLoader — static entity has correct transform", "[scene]") {
    ecs::World world;
    SceneLoader::load_from_string(world, ARENA_SCENE);

    bool found = false;
    world.each<ecs::LocalTransform, BoxCollider, MeshRenderer>(
        [&](ecs::Entity, ecs::LocalTransform& lt, BoxCollider& box, MeshRenderer&) {
            CHECK_THAT(lt.position.x, WithinAbs(1.0f, 1e-4f));
            CHECK_THAT(lt.position.z, WithinAbs(3.0f, 1e-4f));
            CHECK_THAT(lt.scale.y,    WithinAbs(5.0f, 1e-4f));
            CHECK_THAT(box.half_extents.y, WithinAbs(2.5f, 1e-4f));
            found = true;
        });
    CHECK(found);
}

TEST_CASE("SceneLoader — player gets health, movement and a sprite", "[scene]") {
    ecs::World world;
    GameTextures textures;
    textures.ducky = 7;
    world.set_resource(textures);
    SceneLoader::load_from_string(world, ARENA_SCENE);

    int players = 0;
    world.each<PlayerTag, Health, MoveIntent, Sprite>(
        [&](ecs::Entity, PlayerTag&, Health& h, MoveIntent&, Sprite& s) {
            CHECK(h.max() == 80.0f);
            CHECK(h.raw() == 60.0f);
            CHECK(h.change_per_second() == 2.0f);
            CHECK(h.quantize_step() == 1.0f);
            CHECK(s.texture == 7);
            CHECK_THAT(s.size, WithinAbs(1.5f, 1e-4f));
            ++players;
        });
    CHECK(players == 1);
}

TEST_CASE("SceneLoader — sprite before textures are published is unresolved", "[scene]") {
    ecs::World world;
    SceneLoader::load_from_string(world, ARENA_SCENE);
    world.each<Sprite>([&](ecs::Entity, Sprite& s) { CHECK(s.texture == kInvalidAsset); });
}

TEST_CASE("SceneLoader — gameplay components", "[scene]") {
    ecs::World world;
    SceneLoader::load_from_string(world, ARENA_SCENE);

    int triggers = 0;
    world.each<Pickup, SingleTrigger, RigidBodyConfig>(
        [&](ecs::Entity, Pickup& p, SingleTrigger&, RigidBodyConfig& rb) {
            CHECK(p.heal == 30.0f);
            CHECK(rb.sensor);
            ++triggers;
        });
    CHECK(triggers == 1);

    int hazards = 0;
    world.each<Hazard, AutoDespawn>([&](ecs::Entity, Hazard& h, AutoDespawn& d) {
        CHECK(h.damage == 15.0f);
        CHECK(d.mode == AutoDespawn::Mode::Frames);
        CHECK(d.frames == 3);
        ++hazards;
    });
    CHECK(hazards == 1);

    int marked = 0;
    world.each<Cleanup<GameState>>([&](ecs::Entity, Cleanup<GameState>& c) {
        CHECK(c.state == GameState::InGame);
        ++marked;
    });
    CHECK(marked == 1);
}

TEST_CASE("SceneLoader — malformed JSON returns false", "[scene]") {
    ecs::World world;
    CHECK_FALSE(SceneLoader::load_from_string(world, "{bad json"));
    CHECK(world.count() == 0);
}

TEST_CASE("SceneLoader — invalid entity leaves nothing spawned", "[scene]") {
    ecs::World world;
    const char* scene = R"({ "entities": [
        { "tags": ["World"] },
        { "health": { "min": 10, "max": 0 } }
    ]})";
    CHECK_FALSE(SceneLoader::load_from_string(world, scene));
    CHECK(world.count() == 0);

    CHECK_FALSE(SceneLoader::load_from_string(world, R"({ "entities": [ { "cleanup": "Paused" } ] })"));
    CHECK_FALSE(SceneLoader::load_from_string(world, R"({ "entities": [ { "sprite": { "texture": "moon" } } ] })"));
    CHECK(world.count() == 0);
}

TEST_CASE("SceneLoader — unload removes World entities only", "[scene]") {
    ecs::World world;
    SceneLoader::load_from_string(world, ARENA_SCENE);
    SceneLoader::unload(world);
    CHECK(world.count() == 2);
}

// ---------------------------------------------------------------------------
// ConfigLoader
// ---------------------------------------------------------------------------

TEST_CASE("ConfigLoader — defaults for an empty document", "[config]") {
    AppConfig cfg = ConfigLoader::parse("{}");
    CHECK(cfg.window.width == 1280);
    CHECK(cfg.view_mode == ViewMode::Single);
    CHECK(cfg.bindings.empty());
    CHECK(cfg.scene_path == "resources/scenes/arena.json");
}

TEST_CASE("ConfigLoader — reads every section", "[config]") {
    AppConfig cfg = ConfigLoader::parse(R"({
        "window": { "width": 800, "height": 600, "title": "Test" },
        "view": { "mode": "sbs", "sbs_gap": 0.1 },
        "scene": "arena.json",
        "assets": { "ducky": "d.png" },
        "hazards": { "interval": 0.5, "lifetime": 2 },
        "input": [ { "trigger": "down", "key": "R", "action": "Restart" } ]
    })");
    CHECK(cfg.window.height == 600);
    CHECK(cfg.window.title == "Test");
    CHECK(cfg.view_mode == ViewMode::Sbs);
    CHECK_THAT(cfg.sbs_gap, WithinAbs(0.1f, 1e-6f));
    CHECK(cfg.scene_path == "arena.json");
    CHECK(cfg.assets.at("ducky") == "d.png");
    CHECK_THAT(cfg.hazard_interval, WithinAbs(0.5f, 1e-6f));
    REQUIRE(cfg.bindings.size() == 1);
    CHECK(cfg.bindings[0].action == "Restart");
}

TEST_CASE("ConfigLoader — invalid documents throw ConfigError", "[config]") {
    CHECK_THROWS_AS(ConfigLoader::parse("{ not json"), ConfigError);
    CHECK_THROWS_AS(ConfigLoader::parse(R"({ "view": { "mode": "vr" } })"), ConfigError);
    CHECK_THROWS_AS(ConfigLoader::parse(R"({ "window": { "width": "wide" } })"), ConfigError);
    CHECK_THROWS_AS(ConfigLoader::parse(R"({ "window": { "width": 0 } })"), ConfigError);
    CHECK_THROWS_AS(ConfigLoader::parse(R"({ "hazards": { "interval": 0 } })"), ConfigError);
    CHECK_THROWS_AS(ConfigLoader::parse(R"({ "input": [ { "trigger": "hold", "key": "R", "action": "Restart" } ] })"),
                    ConfigError);
    CHECK_THROWS_AS(ConfigLoader::load("does/not/exist.json"), ConfigError);
}

TEST_CASE("Game vocabulary — action and state names", "[config]") {
    GameAction action = GameAction::Exit;
    CHECK(parse_game_action("ToggleSbs", action));
    CHECK(action == GameAction::ToggleSbs);
    CHECK_FALSE(parse_game_action("Fly", action));

    GameState state = GameState::Loading;
    CHECK(parse_game_state("GameOver", state));
    CHECK(std::string(to_string(state)) == "GameOver");
}

// ---------------------------------------------------------------------------
// GameRulesSystem
// ---------------------------------------------------------------------------

struct GameFixture {
    ecs::World world;
    ecs::Entity player;

    GameFixture() {
        world.set_resource(EventRegistry{});
        auto& reg = world.resource<EventRegistry>();
        reg.register_queue<StateTransition<GameState>>(world);
        reg.register_queue<ActionEvent<GameAction>>(world);
        reg.register_queue<CollisionPairStarted<PlayerTag, Hazard>>(world);
        reg.register_queue<CollisionPairStarted<PlayerTag, Pickup>>(world);
        reg.register_queue<DeathEvent>(world);
        reg.register_queue<FullHealEvent>(world);
        world.set_resource(State<GameState>{GameState::InGame});
        world.set_resource(GameSession{});
        world.set_resource(DebugPanel{});

        player = world.create();
        world.add(player, PlayerTag{});
        world.add(player, MoveIntent{});
        world.add(player, Health(0.0f, 100.0f, 20.0f));
    }

    void frame() {
        world.resource<EventRegistry>().flush_all();
        StateSystem<GameState>::Update(world);
    }

    float health() { return world.try_get<Health>(player)->raw(); }
};

TEST_CASE("GameRules — move_velocity normalises diagonals", "[game]") {
    auto v = GameRulesSystem::move_velocity({GameAction::MoveForward, GameAction::MoveRight}, 4.0f);
    CHECK_THAT(v.x, WithinAbs(2.8284f, 1e-3f));
    CHECK_THAT(v.y, WithinAbs(-2.8284f, 1e-3f));

    auto none = GameRulesSystem::move_velocity({GameAction::MoveLeft, GameAction::MoveRight}, 4.0f);
    CHECK(none.x == 0.0f);
    CHECK(none.y == 0.0f);
}

TEST_CASE("GameRules — next_random stays in [0, 1)", "[game]") {
    uint32_t state = 1;
    for (int i = 0; i < 1000; ++i) {
        float r = GameRulesSystem::next_random(state);
        REQUIRE(r >= 0.0f);
        REQUIRE(r < 1.0f);
    }
}

TEST_CASE("GameRules — actions drive movement and toggles", "[game]") {
    GameFixture f;
    f.frame();
    send_event(f.world, ActionEvent<GameAction>{GameAction::MoveBack});
    send_event(f.world, ActionEvent<GameAction>{GameAction::ToggleDebug});
    send_event(f.world, ActionEvent<GameAction>{GameAction::ToggleSbs});
    f.world.set_resource(SbsRig{});

    GameRulesSystem::apply_actions(f.world);

    auto* intent = f.world.try_get<MoveIntent>(f.player);
    CHECK_THAT(intent->velocity.y, WithinAbs(6.0f, 1e-5f));
    CHECK(f.world.resource<DebugPanel>().visible);
    CHECK(f.world.resource<SbsRig>().mode == SbsRig::Mode::Deactivated);

    f.frame();
    GameRulesSystem::apply_actions(f.world);
    CHECK(f.world.try_get<MoveIntent>(f.player)->velocity.y == 0.0f);
}

TEST_CASE("GameRules — hazards damage, pickups heal", "[game]") {
    GameFixture f;
    f.frame();
    auto spike = f.world.create();
    f.world.add(spike, Hazard{15.0f});
    auto potion = f.world.create();
    f.world.add(potion, Pickup{50.0f});

    send_event(f.world, CollisionPairStarted<PlayerTag, Hazard>{f.player, spike});
    GameRulesSystem::apply_contacts(f.world);
    CHECK(f.health() == 5.0f);

    f.frame();
    send_event(f.world, CollisionPairStarted<PlayerTag, Pickup>{f.player, potion});
    GameRulesSystem::apply_contacts(f.world);
    CHECK(f.health() == 55.0f);
}

TEST_CASE("GameRules — player death requests GameOver, Restart returns", "[game]") {
    GameFixture f;
    f.frame();
    auto spike = f.world.create();
    f.world.add(spike, Hazard{50.0f});

    send_event(f.world, CollisionPairStarted<PlayerTag, Hazard>{f.player, spike});
    GameRulesSystem::apply_contacts(f.world);
    GameRulesSystem::check_death(f.world);
    CHECK(f.world.resource<GameSession>().deaths == 1);

    f.frame();
    CHECK(f.world.resource<State<GameState>>().is(GameState::GameOver));

    send_event(f.world, ActionEvent<GameAction>{GameAction::Restart});
    GameRulesSystem::apply_actions(f.world);
    f.frame();
    CHECK(f.world.resource<State<GameState>>().is(GameState::InGame));
}

TEST_CASE("GameRules — Restart is ignored while playing", "[game]") {
    GameFixture f;
    f.frame();
    send_event(f.world, ActionEvent<GameAction>{GameAction::Restart});
    GameRulesSystem::apply_actions(f.world);
    CHECK_FALSE(f.world.resource<State<GameState>>().next().has_value());
}

TEST_CASE("GameRules — hazards spawn on the interval with a lifetime", "[game]") {
    GameFixture f;
    f.frame();
    f.world.resource<GameSession>().hazard_interval = 1.0f;
    f.world.resource<GameSession>().hazard_lifetime = 3.0f;

    GameRulesSystem::spawn_hazards(f.world, 0.6f);
    f.world.deferred().flush(f.world);
    CHECK(f.world.count() == 1);

    GameRulesSystem::spawn_hazards(f.world, 0.6f);
    f.world.deferred().flush(f.world);
    REQUIRE(f.world.count() == 2);

    int hazards = 0;
    f.world.each<Hazard, AutoDespawn, Cleanup<GameState>, ecs::LocalTransform>(
        [&](ecs::Entity, Hazard&, AutoDespawn& d, Cleanup<GameState>& c, ecs::LocalTransform& lt) {
            CHECK(d.duration == 3.0f);
            CHECK(c.state == GameState::InGame);
            CHECK(lt.position.x >= -9.0f);
            CHECK(lt.position.x <= 9.0f);
            ++hazards;
        });
    CHECK(hazards == 1);
}

TEST_CASE("GameRules — exit action flags the session", "[game]") {
    GameFixture f;
    f.frame();
    send_event(f.world, ActionEvent<GameAction>{GameAction::Exit});
    GameRulesSystem::apply_actions(f.world);
    CHECK(f.world.resource<GameSession>().exit_requested);
}
