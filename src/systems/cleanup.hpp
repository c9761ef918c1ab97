#pragma once
#include "../app_state.hpp"
#include "../events.hpp"
#include <ecs/ecs.hpp>
#include <vector>

// Marks an entity for removal when the state machine leaves `state`.
template<typename S>
struct Cleanup {
    S state;
};

// ---------------------------------------------------------------------------
// CleanupSystem<S> — Logic-phase system; subscribes to StateTransition<S>.
//
// For every transition this frame, destroys the entities whose Cleanup<S>
// names the state that was exited.
// ---------------------------------------------------------------------------

template<typename S>
class CleanupSystem {
public:
    static void Update(ecs::World& world) {
        const auto* transitions = world.try_resource<Events<StateTransition<S>>>();
        if (!transitions || transitions->empty()) return;

        std::vector<ecs::Entity> to_destroy;
        for (const auto& t : transitions->read()) {
            if (!t.from) continue;
            const S exited = *t.from;
            world.each<Cleanup<S>>([&](ecs::Entity e, Cleanup<S>& c) {
                if (c.state == exited) to_destroy.push_back(e);
            });
        }

        if (to_destroy.empty()) return;
        for (auto e : to_destroy) world.destroy(e);
        world.deferred().flush(world);
    }
};
