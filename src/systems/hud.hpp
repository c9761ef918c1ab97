#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// HudSystem — Render phase, after DebugSystem.
//
// Loading: progress bar from LoadingProgress<GameState>; the texture
// loader's failure message.
// InGame:  player health and the control summary.
// GameOver: restart prompt.
// ---------------------------------------------------------------------------

class HudSystem {
public:
    static void Update(ecs::World& world);
};
