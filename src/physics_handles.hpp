#pragma once
#include "systems/collision.hpp"
#include <Jolt/Jolt.h>
#include <Jolt/Physics/Body/BodyID.h>
#include <ecs/ecs.hpp>
#include <ecs/modules/transform.hpp>

// ---------------------------------------------------------------------------
// Jolt <-> ECS conversions. Kept out of components.hpp and collision.hpp so
// the headless targets never see a Jolt header.
// ---------------------------------------------------------------------------
namespace MathBridge {
    inline JPH::Vec3 ToJolt(const ecs::Vec3& v) { return {v.x, v.y, v.z}; }
    inline JPH::Quat ToJolt(const ecs::Quat& q) { return {q.x, q.y, q.z, q.w}; }

    inline ecs::Vec3 FromJolt(const JPH::Vec3& v) { return {v.GetX(), v.GetY(), v.GetZ()}; }
    inline ecs::Quat FromJolt(const JPH::Quat& q) { return {q.GetX(), q.GetY(), q.GetZ(), q.GetW()}; }
#ifdef JPH_DOUBLE_PRECISION
    inline ecs::Vec3 FromJolt(const JPH::RVec3& v) {
        return {static_cast<float>(v.GetX()), static_cast<float>(v.GetY()), static_cast<float>(v.GetZ())};
    }
#endif
}

// Registry key of a body. Index and sequence number together, so a recycled
// body slot never resolves to the entity that owned the previous body.
inline BodyKey body_key(const JPH::BodyID& id) {
    return id.GetIndexAndSequenceNumber();
}

// Added by PhysicsSystem once the body for a RigidBodyConfig exists and is
// bound in BodyRegistry. Removing it unbinds and destroys the body.
struct RigidBodyHandle {
    JPH::BodyID id;

    BodyKey key() const { return body_key(id); }
};
