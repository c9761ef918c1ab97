#pragma once
#include "../events.hpp"
#include <ecs/ecs.hpp>
#include <algorithm>
#include <cstdint>
#include <unordered_map>
#include <vector>

// ---------------------------------------------------------------------------
// Collision bridge
//
// PhysicsSystem records each contact-added / contact-removed notification as
// a RawContact (body keys are JPH::BodyID::GetIndexAndSequenceNumber()) in
// the ContactBuffer resource. CollisionBridgeSystem resolves the keys to
// entities through BodyRegistry and republishes CollisionStarted /
// CollisionStopped. No Jolt types cross this header.
// ---------------------------------------------------------------------------

using BodyKey = uint32_t;

struct RawContact {
    BodyKey body_a;
    BodyKey body_b;
    bool    started;  // false: the bodies separated
};

struct ContactBuffer {
    std::vector<RawContact> contacts;
};

// Maps live physics bodies back to their owning entity.
// Maintained by PhysicsSystem's on_add / on_remove hooks.
class BodyRegistry {
public:
    void bind(BodyKey body, ecs::Entity e) { bodies_.insert_or_assign(body, e); }
    void unbind(BodyKey body)              { bodies_.erase(body); }

    const ecs::Entity* find(BodyKey body) const {
        auto it = bodies_.find(body);
        return it == bodies_.end() ? nullptr : &it->second;
    }

    size_t size() const { return bodies_.size(); }

private:
    std::unordered_map<BodyKey, ecs::Entity> bodies_;
};

// Logic-phase system. Must run before any consumer of the collision events.
class CollisionBridgeSystem {
public:
    // Drains ContactBuffer into the event queues.
    static void Update(ecs::World& world);

    // Translates raw contacts; contacts with an unknown body are dropped.
    // Returns the number of events sent. Exposed for unit testing.
    static size_t translate(ecs::World& world, const std::vector<RawContact>& contacts);
};

// ---------------------------------------------------------------------------
// Typed collision pairs
//
// CollisionDetectionSystem<C1, C2> narrows the generic events to contacts
// between an entity carrying C1 and one carrying C2. `first` always has C1
// and `second` always has C2, whatever order the physics engine used.
// ---------------------------------------------------------------------------

template<typename C1, typename C2>
struct CollisionPairStarted {
    ecs::Entity first;
    ecs::Entity second;
};

template<typename C1, typename C2>
struct CollisionPairStopped {
    ecs::Entity first;
    ecs::Entity second;
};

template<typename C1, typename C2>
class CollisionDetectionSystem {
public:
    static void Update(ecs::World& world) {
        if (const auto* started = world.try_resource<Events<CollisionStarted>>()) {
            for (const auto& ev : started->read()) {
                ecs::Entity first, second;
                if (order(world, ev.a, ev.b, first, second))
                    send_event(world, CollisionPairStarted<C1, C2>{first, second});
            }
        }
        if (const auto* stopped = world.try_resource<Events<CollisionStopped>>()) {
            for (const auto& ev : stopped->read()) {
                ecs::Entity first, second;
                if (order(world, ev.a, ev.b, first, second))
                    send_event(world, CollisionPairStopped<C1, C2>{first, second});
            }
        }
    }

private:
    static bool order(ecs::World& world, ecs::Entity a, ecs::Entity b,
                      ecs::Entity& first, ecs::Entity& second) {
        if (world.has<C1>(a) && world.has<C2>(b)) {
            first = a; second = b;
            return true;
        }
        if (world.has<C1>(b) && world.has<C2>(a)) {
            first = b; second = a;
            return true;
        }
        return false;
    }
};

// ---------------------------------------------------------------------------
// Single-use triggers
//
// An entity tagged SingleTrigger is destroyed once an Emitter stops touching
// it, so it fires its (Emitter, Trigger) pair events exactly once.
// ---------------------------------------------------------------------------

struct SingleTrigger {};

template<typename Emitter>
class SingleTriggerSystem {
public:
    static void Update(ecs::World& world) {
        const auto* stopped = world.try_resource<Events<CollisionPairStopped<Emitter, SingleTrigger>>>();
        if (!stopped || stopped->empty()) return;

        std::vector<ecs::Entity> spent;
        for (const auto& ev : stopped->read()) {
            if (!world.has<SingleTrigger>(ev.second)) continue;
            if (std::find(spent.begin(), spent.end(), ev.second) == spent.end()) spent.push_back(ev.second);
        }
        for (auto e : spent) world.destroy(e);
        world.deferred().flush(world);
    }
};
