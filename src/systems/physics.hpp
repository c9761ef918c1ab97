#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// PhysicsSystem
//
// Register() installs the lifecycle hooks: a RigidBodyConfig creates the Jolt
// body (shape from BoxCollider / SphereCollider) and binds it in BodyRegistry;
// removing the RigidBodyHandle unbinds and destroys it.
//
// Update() runs in the fixed-step Physics phase: applies MoveIntent, steps
// the simulation, copies dynamic poses back to the transforms, and appends
// the step's contacts to ContactBuffer for CollisionBridgeSystem.
// ---------------------------------------------------------------------------

class PhysicsSystem {
public:
    static void Register(ecs::World& world);
    static void Update(ecs::World& world, float dt);
};
