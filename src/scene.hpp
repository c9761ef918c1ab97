#pragma once
#include <ecs/ecs.hpp>
#include <string>

// ---------------------------------------------------------------------------
// SceneLoader — reads JSON scene files and populates an ECS World.
//
// Components are added in lifecycle-safe order (transform and colliders
// before rigid_body) so on_add hooks fire with sibling data present.
// Sprite texture slots resolve against the GameTextures resource; before it
// is published sprites carry kInvalidAsset and are not drawn.
// No Jolt or Raylib dependency — compilable in the headless test target.
// ---------------------------------------------------------------------------

class SceneLoader {
public:
    // Load entities from a JSON file into world.
    // Returns false if the file cannot be opened or the scene is invalid;
    // in that case nothing is left spawned.
    static bool load(ecs::World& world, const std::string& path);

    // Same as load() without the file I/O. Intended for unit testing.
    static bool load_from_string(ecs::World& world, const std::string& json);

    // Destroy all WorldTag entities and flush deferred commands.
    static void unload(ecs::World& world);
};
