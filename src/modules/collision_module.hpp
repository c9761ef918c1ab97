#pragma once
#include "../events.hpp"
#include "../pipeline.hpp"
#include "../systems/collision.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// CollisionDetectionModule<C1, C2>
//
// Registers CollisionPairStarted/Stopped<C1, C2> and adds the filtering
// system to the Logic phase. Install after PhysicsModule (the bridge must
// run first in the frame) and before the pair's consumers. Installing the
// same pair again does nothing.
// ---------------------------------------------------------------------------

template<typename C1, typename C2>
struct CollisionDetectionModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        if (world.try_resource<Events<CollisionPairStarted<C1, C2>>>()) return;
        world.resource<EventRegistry>().register_queue<CollisionPairStarted<C1, C2>>(world);
        world.resource<EventRegistry>().register_queue<CollisionPairStopped<C1, C2>>(world);
        pipeline.add_logic([](ecs::World& w, float) { CollisionDetectionSystem<C1, C2>::Update(w); });
    }
};

// ---------------------------------------------------------------------------
// TriggerModule<Emitter, Trigger>
//
// Typed pair events for (Emitter, Trigger), plus single-use behaviour: a
// Trigger entity that also carries SingleTrigger is destroyed once the
// Emitter stops touching it. The removal runs as a later Logic step, so the
// pair events of that frame still name a live entity. Triggers sharing an
// Emitter share one (Emitter, SingleTrigger) pair system and one removal
// step.
// ---------------------------------------------------------------------------

// Present once the removal step for Emitter has been added.
template<typename Emitter>
struct SingleTriggerCleanupInstalled {};

template<typename Emitter, typename Trigger>
struct TriggerModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        CollisionDetectionModule<Emitter, Trigger>::install(world, pipeline);
        CollisionDetectionModule<Emitter, SingleTrigger>::install(world, pipeline);
    }

    // Adds the removal step. Call after the modules that consume the
    // trigger's pair events.
    static void install_cleanup(ecs::World& world, ecs::Pipeline& pipeline) {
        if (world.try_resource<SingleTriggerCleanupInstalled<Emitter>>()) return;
        world.set_resource(SingleTriggerCleanupInstalled<Emitter>{});
        pipeline.add_logic([](ecs::World& w, float) { SingleTriggerSystem<Emitter>::Update(w); });
    }
};
