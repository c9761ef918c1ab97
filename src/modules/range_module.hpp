#pragma once
#include "../debug_panel.hpp"
#include "../events.hpp"
#include "../health.hpp"
#include "../pipeline.hpp"
#include "../range.hpp"
#include <ecs/ecs.hpp>
#include <string>

// ---------------------------------------------------------------------------
// RangeModule<Tag>
//
// Registers RangeMinReached<Tag> / RangeMaxReached<Tag> and adds
// RangeSystem<Tag> (change_per_second) to the Logic phase. Systems that call
// RangeSystem<Tag>::modify() must be installed before this module when they
// rely on regeneration being applied after their own changes.
// ---------------------------------------------------------------------------

template<typename Tag>
struct RangeModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.resource<EventRegistry>().register_queue<RangeMinReached<Tag>>(world);
        world.resource<EventRegistry>().register_queue<RangeMaxReached<Tag>>(world);
        pipeline.add_logic([](ecs::World& w, float dt) { RangeSystem<Tag>::Update(w, dt); });
    }
};

// ---------------------------------------------------------------------------
// HealthModule — RangeModule<HealthMarker> plus a "Health" debug row
// listing every entity's current / max.
// ---------------------------------------------------------------------------

struct HealthModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        RangeModule<HealthMarker>::install(world, pipeline);

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Health", "Entities", [&world]() {
                int n = 0;
                world.each<Health>([&](ecs::Entity, Health&) { n++; });
                return std::to_string(n);
            });
        }
    }
};
