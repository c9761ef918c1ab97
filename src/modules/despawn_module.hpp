#pragma once
#include "../pipeline.hpp"
#include "../systems/despawn.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// DespawnModule
//
// Adds DespawnSystem to the Logic phase. Install after the systems that
// still need to see short-lived entities in the frame they expire.
// ---------------------------------------------------------------------------

struct DespawnModule {
    static void install(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_logic([](ecs::World& w, float dt) { DespawnSystem::Update(w, dt); });
    }
};
