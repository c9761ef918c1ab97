#pragma once
#include <ecs/ecs.hpp>
#include <functional>
#include <vector>

// ---------------------------------------------------------------------------
// Events<T> — typed, frame-scoped event queue
//
// Stored as a World resource. Systems emit via send() and consume via read().
// EventRegistry::flush_all() clears all queues at the start of each frame.
// ---------------------------------------------------------------------------

template<typename T>
struct Events {
    void send(T event)                     { buffer_.push_back(std::move(event)); }
    const std::vector<T>& read()   const  { return buffer_; }
    bool                  empty()  const  { return buffer_.empty(); }
    void                  clear()         { buffer_.clear(); }

private:
    std::vector<T> buffer_;
};

// ---------------------------------------------------------------------------
// EventRegistry — flush coordinator (stored as a World resource)
//
// Call register_queue<T>(world) once per event type during startup. Several
// modules may emit the same event type; registering it again is a no-op, so
// a queue that already holds events is never replaced.
// Call flush_all() as the first Pre-Update step each frame.
// ---------------------------------------------------------------------------

class EventRegistry {
public:
    template<typename T>
    void register_queue(ecs::World& world) {
        if (world.try_resource<Events<T>>()) return;
        world.set_resource(Events<T>{});
        flush_fns_.push_back([&world]() {
            if (auto* q = world.try_resource<Events<T>>()) q->clear();
        });
    }

    void flush_all() {
        for (auto& fn : flush_fns_) fn();
    }

    size_t queue_count() const { return flush_fns_.size(); }

private:
    std::vector<std::function<void()>> flush_fns_;
};

// Convenience for systems that emit into a queue which may not be installed.
template<typename T>
inline void send_event(ecs::World& world, T event) {
    if (auto* q = world.try_resource<Events<T>>()) q->send(std::move(event));
}

// ---------------------------------------------------------------------------
// Window events
// ---------------------------------------------------------------------------

// Emitted by InputGatherSystem on the first frame and whenever the window
// size changes. Sizes are in pixels.
struct WindowResized {
    int width;
    int height;
};

// ---------------------------------------------------------------------------
// Collision events (CollisionBridgeSystem)
//
// Emitted in the order the physics engine reported the contacts. a and b are
// the two entities owning the touching bodies, in no particular order.
// ---------------------------------------------------------------------------

struct CollisionStarted {
    ecs::Entity a;
    ecs::Entity b;
};

struct CollisionStopped {
    ecs::Entity a;
    ecs::Entity b;
};
