#include "scene.hpp"
#include "components.hpp"
#include "game_assets.hpp"
#include "game_state.hpp"
#include "health.hpp"
#include "systems/cleanup.hpp"
#include "systems/collision.hpp"
#include <ecs/modules/transform.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static ecs::Vec3 parse_vec3(const json& j) {
    return {j.at(0).get<float>(), j.at(1).get<float>(), j.at(2).get<float>()};
}

static ecs::Quat parse_quat(const json& j) {
    // stored as [x, y, z, w]
    return {j.at(0).get<float>(), j.at(1).get<float>(), j.at(2).get<float>(), j.at(3).get<float>()};
}

static Color4 parse_color4(const json& j) {
    return {j.at(0).get<float>(), j.at(1).get<float>(), j.at(2).get<float>(), j.at(3).get<float>()};
}

static ShapeType parse_shape(const std::string& s) {
    if (s == "Box")     return ShapeType::Box;
    if (s == "Sphere")  return ShapeType::Sphere;
    if (s == "Capsule") return ShapeType::Capsule;
    throw std::runtime_error("SceneLoader: unknown shape '" + s + "'");
}

static BodyType parse_body_type(const std::string& s) {
    if (s == "Static")    return BodyType::Static;
    if (s == "Dynamic")   return BodyType::Dynamic;
    if (s == "Kinematic") return BodyType::Kinematic;
    throw std::runtime_error("SceneLoader: unknown body type '" + s + "'");
}

static AssetHandle resolve_texture(ecs::World& world, const std::string& slot) {
    static const auto manifest = game_texture_manifest();
    const auto* entry = manifest.find(slot);
    if (!entry) throw std::runtime_error("SceneLoader: unknown texture slot '" + slot + "'");
    const auto* textures = world.try_resource<GameTextures>();
    return textures ? textures->*(entry->field) : kInvalidAsset;
}

// ---------------------------------------------------------------------------
// Entity spawning
// ---------------------------------------------------------------------------

static void spawn_entity(ecs::World& world, const json& e, std::vector<ecs::Entity>& spawned) {
    auto ent = world.create();
    spawned.push_back(ent);

    // 1. LocalTransform + WorldTransform (must precede physics hooks)
    if (e.contains("transform")) {
        const auto& t = e["transform"];
        ecs::Vec3 pos = t.contains("position") ? parse_vec3(t["position"]) : ecs::Vec3{0,0,0};
        ecs::Quat rot = t.contains("rotation") ? parse_quat(t["rotation"]) : ecs::Quat{0,0,0,1};
        ecs::Vec3 scl = t.contains("scale")    ? parse_vec3(t["scale"])    : ecs::Vec3{1,1,1};
        world.add(ent, ecs::LocalTransform{pos, rot, scl});
        world.add(ent, ecs::WorldTransform{});
    }

    // 2. Colliders (must precede RigidBodyConfig so PhysicsSystem can read them)
    if (e.contains("box_collider")) {
        world.add(ent, BoxCollider{parse_vec3(e["box_collider"].at("half_extents"))});
    }
    if (e.contains("sphere_collider")) {
        world.add(ent, SphereCollider{e["sphere_collider"].at("radius").get<float>()});
    }

    // 3. Visual representation
    if (e.contains("mesh")) {
        const auto& m = e["mesh"];
        ShapeType shape        = parse_shape(m.value("shape", std::string("Box")));
        Color4    color        = m.contains("color")        ? parse_color4(m["color"])      : Colors::White;
        ecs::Vec3 scale_offset = m.contains("scale_offset") ? parse_vec3(m["scale_offset"]) : ecs::Vec3{1,1,1};
        world.add(ent, MeshRenderer{shape, color, scale_offset});
    }
    if (e.contains("sprite")) {
        const auto& s = e["sprite"];
        Sprite sprite;
        sprite.texture = resolve_texture(world, s.at("texture").get<std::string>());
        sprite.size    = s.value("size", 1.0f);
        if (s.contains("tint")) sprite.tint = parse_color4(s["tint"]);
        world.add(ent, sprite);
    }

    // 4. Gameplay data
    if (e.contains("health")) {
        const auto& h = e["health"];
        float min = h.value("min", 0.0f);
        float max = h.value("max", 100.0f);
        Health health(min, max, h.value("current", max));
        health.with_quantize(h.value("quantize", 0.0f))
              .with_change_per_second(h.value("regen", 0.0f));
        world.add(ent, health);
    }
    if (e.contains("hazard")) {
        world.add(ent, Hazard{e["hazard"].value("damage", 10.0f)});
    }
    if (e.contains("pickup")) {
        world.add(ent, Pickup{e["pickup"].value("heal", 25.0f)});
    }
    if (e.contains("auto_despawn")) {
        const auto& d = e["auto_despawn"];
        if (d.contains("frames")) {
            world.add(ent, AutoDespawn::after_frames(d["frames"].get<uint32_t>()));
        } else {
            world.add(ent, AutoDespawn::after_seconds(d.at("seconds").get<float>()));
        }
    }
    if (e.contains("cleanup")) {
        GameState state = GameState::InGame;
        const std::string name = e["cleanup"].get<std::string>();
        if (!parse_game_state(name, state)) {
            throw std::runtime_error("SceneLoader: unknown state '" + name + "'");
        }
        world.add(ent, Cleanup<GameState>{state});
    }

    // 5. Tags and player-specific components
    if (e.contains("tags")) {
        for (const auto& tag : e["tags"]) {
            const std::string t = tag.get<std::string>();
            if (t == "World")  world.add(ent, WorldTag{});
            if (t == "Player") {
                world.add(ent, PlayerTag{});
                world.add(ent, MoveIntent{});
            }
            if (t == "Trigger") world.add(ent, SingleTrigger{});
        }
    }

    // 6. Physics (triggers on_add lifecycle hooks — added last so sibling
    //    components are already present when the hook fires)
    if (e.contains("rigid_body")) {
        const auto& rb = e["rigid_body"];
        RigidBodyConfig cfg;
        cfg.type        = parse_body_type(rb.value("type", std::string("Dynamic")));
        cfg.mass        = rb.value("mass",        1.0f);
        cfg.friction    = rb.value("friction",    0.5f);
        cfg.restitution = rb.value("restitution", 0.0f);
        cfg.sensor      = rb.value("sensor",      false);
        world.add(ent, std::move(cfg));
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

bool SceneLoader::load_from_string(ecs::World& world, const std::string& json_str) {
    std::vector<ecs::Entity> spawned;
    try {
        json scene = json::parse(json_str);
        for (const auto& entity_json : scene.at("entities")) {
            spawn_entity(world, entity_json, spawned);
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[Scene] " << e.what() << std::endl;
        for (auto ent : spawned) world.destroy(ent);
        world.deferred().flush(world);
        return false;
    }
}

bool SceneLoader::load(ecs::World& world, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Scene] Cannot open " << path << std::endl;
        return false;
    }
    const std::string content(std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>{});
    return load_from_string(world, content);
}

void SceneLoader::unload(ecs::World& world) {
    std::vector<ecs::Entity> to_destroy;
    world.each<WorldTag>([&](ecs::Entity e, WorldTag&) { to_destroy.push_back(e); });
    for (auto e : to_destroy) world.destroy(e);
    world.deferred().flush(world);
}
