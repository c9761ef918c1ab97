#pragma once
#include <Jolt/Jolt.h>
#include <Jolt/RegisterTypes.h>
#include <Jolt/Core/Factory.h>
#include <Jolt/Core/TempAllocator.h>
#include <Jolt/Core/JobSystemThreadPool.h>
#include <Jolt/Physics/PhysicsSettings.h>
#include <Jolt/Physics/PhysicsSystem.h>
#include <Jolt/Physics/Collision/Shape/BoxShape.h>
#include <Jolt/Physics/Collision/Shape/SphereShape.h>
#include <Jolt/Physics/Body/BodyCreationSettings.h>
#include <Jolt/Physics/Body/BodyActivationListener.h>
#include <Jolt/Physics/Body/Body.h>
#include <Jolt/Physics/Collision/ContactListener.h>
#include <ecs/modules/transform.hpp>
#include "physics_handles.hpp"
#include "systems/collision.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

// Layer definitions
namespace Layers {
    static constexpr JPH::ObjectLayer NON_MOVING = 0;
    static constexpr JPH::ObjectLayer MOVING = 1;
    static constexpr JPH::ObjectLayer NUM_LAYERS = 2;
};

namespace BroadPhaseLayers {
    static constexpr JPH::BroadPhaseLayer NON_MOVING(0);
    static constexpr JPH::BroadPhaseLayer MOVING(1);
    static constexpr JPH::uint NUM_LAYERS(2);
};

// ---------------------------------------------------------------------------
// Jolt Boilerplate Implementation
// ---------------------------------------------------------------------------

class BPLayerInterfaceImpl final : public JPH::BroadPhaseLayerInterface {
public:
    BPLayerInterfaceImpl() {
        // Create a mapping table from object layer to broad phase layer
        mObjectToBroadPhase[Layers::NON_MOVING] = BroadPhaseLayers::NON_MOVING;
        mObjectToBroadPhase[Layers::MOVING] = BroadPhaseLayers::MOVING;
    }

    virtual JPH::uint GetNumBroadPhaseLayers() const override {
        return BroadPhaseLayers::NUM_LAYERS;
    }

    virtual JPH::BroadPhaseLayer GetBroadPhaseLayer(JPH::ObjectLayer inLayer) const override {
        JPH_ASSERT(inLayer < Layers::NUM_LAYERS);
        return mObjectToBroadPhase[inLayer];
    }

#if defined(JPH_EXTERNAL_PROFILE) || defined(JPH_PROFILE_ENABLED)
    virtual const char *GetBroadPhaseLayerName(JPH::BroadPhaseLayer inLayer) const override {
        switch ((JPH::BroadPhaseLayer::Type)inLayer) {
            case (JPH::BroadPhaseLayer::Type)BroadPhaseLayers::NON_MOVING: return "NON_MOVING";
            case (JPH::BroadPhaseLayer::Type)BroadPhaseLayers::MOVING: return "MOVING";
            default: JPH_ASSERT(false); return "INVALID";
        }
    }
#endif // JPH_EXTERNAL_PROFILE || JPH_PROFILE_ENABLED

private:
    JPH::BroadPhaseLayer mObjectToBroadPhase[Layers::NUM_LAYERS];
};

class ObjectVsBroadPhaseLayerFilterImpl : public JPH::ObjectVsBroadPhaseLayerFilter {
public:
    virtual bool ShouldCollide(JPH::ObjectLayer inLayer1, JPH::BroadPhaseLayer inLayer2) const override {
        switch (inLayer1) {
            case Layers::NON_MOVING:
                return inLayer2 == BroadPhaseLayers::MOVING;
            case Layers::MOVING:
                return true; // Collides with everything
            default:
                JPH_ASSERT(false);
                return false;
        }
    }
};

class ObjectLayerPairFilterImpl : public JPH::ObjectLayerPairFilter {
public:
    virtual bool ShouldCollide(JPH::ObjectLayer inObject1, JPH::ObjectLayer inObject2) const override {
        switch (inObject1) {
            case Layers::NON_MOVING:
                return inObject2 == Layers::MOVING; // Non moving only collides with moving
            case Layers::MOVING:
                return true; // Moving collides with everything
            default:
                JPH_ASSERT(false);
                return false;
        }
    }
};

// ---------------------------------------------------------------------------
// Contact collection
//
// Jolt reports contacts from its worker threads during PhysicsSystem::Update,
// so notifications are queued under a mutex and drained on the main thread
// once the step has finished. Only the body pair survives; the bridge turns
// it into entity-level events.
// ---------------------------------------------------------------------------

class ContactCollector final : public JPH::ContactListener {
public:
    void OnContactAdded(const JPH::Body& inBody1, const JPH::Body& inBody2,
                        const JPH::ContactManifold&, JPH::ContactSettings&) override {
        push({body_key(inBody1.GetID()), body_key(inBody2.GetID()), true});
    }

    void OnContactRemoved(const JPH::SubShapeIDPair& inSubShapePair) override {
        push({body_key(inSubShapePair.GetBody1ID()), body_key(inSubShapePair.GetBody2ID()), false});
    }

    // Moves the queued contacts to the end of out.
    void drain(std::vector<RawContact>& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        out.insert(out.end(), pending_.begin(), pending_.end());
        pending_.clear();
    }

private:
    void push(RawContact contact) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back(contact);
    }

    std::mutex              mutex_;
    std::vector<RawContact> pending_;
};

// ---------------------------------------------------------------------------
// Physics Context Resource
// ---------------------------------------------------------------------------

class PhysicsContext {
public:
    JPH::TempAllocatorImpl* temp_allocator = nullptr;
    JPH::JobSystemThreadPool* job_system = nullptr;
    JPH::PhysicsSystem* physics_system = nullptr;

    // Layer interfaces
    BPLayerInterfaceImpl broad_phase_layer_interface;
    ObjectVsBroadPhaseLayerFilterImpl object_vs_broadphase_layer_filter;
    ObjectLayerPairFilterImpl object_layer_pair_filter;

    ContactCollector contacts;

    // Allocator for Jolt (Singleton)
    static void InitJoltAllocator() {
        JPH::RegisterDefaultAllocator();
    }

    explicit PhysicsContext(ecs::Vec3 gravity = {0.0f, -9.81f, 0.0f}) {
        JPH::Factory::sInstance = new JPH::Factory();
        JPH::RegisterTypes();

        temp_allocator = new JPH::TempAllocatorImpl(10 * 1024 * 1024);
        int workers = std::max(1, static_cast<int>(std::thread::hardware_concurrency()) - 1);
        job_system = new JPH::JobSystemThreadPool(JPH::cMaxPhysicsJobs, JPH::cMaxPhysicsBarriers, workers);

        physics_system = new JPH::PhysicsSystem();
        physics_system->Init(1024, 0, 1024, 1024, broad_phase_layer_interface, object_vs_broadphase_layer_filter, object_layer_pair_filter);
        physics_system->SetGravity(JPH::Vec3(gravity.x, gravity.y, gravity.z));
        physics_system->SetContactListener(&contacts);

        std::cout << "[Physics] Jolt initialized (" << workers << " worker threads)" << std::endl;
    }

    ~PhysicsContext() {
        if (physics_system) delete physics_system;
        if (job_system) delete job_system;
        if (temp_allocator) delete temp_allocator;
        if (JPH::Factory::sInstance) {
             delete JPH::Factory::sInstance;
             JPH::Factory::sInstance = nullptr;
        }
    }

    PhysicsContext(const PhysicsContext&) = delete;
    PhysicsContext& operator=(const PhysicsContext&) = delete;

    JPH::BodyInterface& GetBodyInterface() { return physics_system->GetBodyInterface(); }
    const JPH::BodyInterface& GetBodyInterface() const { return physics_system->GetBodyInterface(); }
};
