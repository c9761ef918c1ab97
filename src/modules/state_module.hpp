#pragma once
#include "../app_state.hpp"
#include "../events.hpp"
#include "../pipeline.hpp"
#include "../systems/cleanup.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// StateModule<S>
//
// Creates State<S> in `initial`, registers StateTransition<S>, and adds
// StateSystem<S> to Pre-Update. Install right after EventBusModule so the
// transition is visible to every Logic system of the same frame.
// ---------------------------------------------------------------------------

template<typename S>
struct StateModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline, S initial) {
        world.set_resource(State<S>{initial});
        world.resource<EventRegistry>().register_queue<StateTransition<S>>(world);
        pipeline.add_pre_update([](ecs::World& w, float) { StateSystem<S>::Update(w); });
    }
};

// ---------------------------------------------------------------------------
// CleanupModule<S>
//
// Adds CleanupSystem<S> to the Logic phase: entities marked Cleanup<S>{s}
// are destroyed in the frame the state machine leaves s. Requires
// StateModule<S>.
// ---------------------------------------------------------------------------

template<typename S>
struct CleanupModule {
    static void install(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_logic([](ecs::World& w, float) { CleanupSystem<S>::Update(w); });
    }
};
