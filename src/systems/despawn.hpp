#pragma once
#include <ecs/ecs.hpp>
#include "../components.hpp"

// Destroys entities whose AutoDespawn has expired. Runs in the Logic phase.
class DespawnSystem {
public:
    static void Update(ecs::World& world, float dt);

    // Advances one frame. Returns true on the tick the component expires.
    // Pure — exposed for unit testing.
    static bool tick(AutoDespawn& despawn, float dt);
};
