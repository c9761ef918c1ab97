#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// InputGatherSystem — Pre-Update, right after the event flush.
//
// Snapshots raylib's keyboard and mouse state into the InputRecord resource
// and keeps WindowInfo current. Sends WindowResized on the first frame and
// whenever the window size changes.
// ---------------------------------------------------------------------------

class InputGatherSystem {
public:
    static void Update(ecs::World& world);
};
