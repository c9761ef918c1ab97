#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// DebugSystem — Render-phase system; draws the DebugPanel overlay on top of
// the composed camera views. Runs between RenderSystem::Update and
// RenderSystem::Present.
// ---------------------------------------------------------------------------

class DebugSystem {
public:
    static void Update(ecs::World& world);
};
