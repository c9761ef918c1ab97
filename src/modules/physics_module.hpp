#pragma once
#include "../debug_panel.hpp"
#include "../events.hpp"
#include "../physics_context.hpp"
#include "../pipeline.hpp"
#include "../systems/collision.hpp"
#include "../systems/physics.hpp"
#include <ecs/ecs.hpp>
#include <ecs/modules/transform_propagation.hpp>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// PhysicsModule
//
// Initialises Jolt's allocator, creates the PhysicsContext world resource,
// installs PhysicsSystem lifecycle hooks (on_add RigidBodyConfig / on_remove
// RigidBodyHandle, which also maintain BodyRegistry), and wires the
// fixed-step physics update + transform propagation into the Physics phase.
//
// The collision bridge is the first Logic step this module adds: install
// PhysicsModule before any module that consumes CollisionStarted /
// CollisionStopped.
// ---------------------------------------------------------------------------

struct PhysicsModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        PhysicsContext::InitJoltAllocator();
        world.set_resource(std::make_shared<PhysicsContext>());
        PhysicsSystem::Register(world);

        world.resource<EventRegistry>().register_queue<CollisionStarted>(world);
        world.resource<EventRegistry>().register_queue<CollisionStopped>(world);
        pipeline.add_logic([](ecs::World& w, float) { CollisionBridgeSystem::Update(w); });

        pipeline.add_physics([](ecs::World& w, float dt) {
            PhysicsSystem::Update(w, dt);
            ecs::propagate_transforms(w);
        });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Physics", "Bodies", [&world]() {
                auto* registry = world.try_resource<BodyRegistry>();
                return registry ? std::to_string(registry->size()) : std::string("-");
            });
        }
    }
};
