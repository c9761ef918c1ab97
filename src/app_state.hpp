#pragma once
#include "events.hpp"
#include <ecs/ecs.hpp>
#include <iostream>
#include <optional>

// ---------------------------------------------------------------------------
// State<S> — finite application state machine (stored as a World resource)
//
// Systems request a change with set(); StateSystem<S> applies it at the
// start of the next frame and publishes a StateTransition<S>. Subscribers
// (cleanup, loading, game rules) read that event queue instead of polling
// the current value.
// ---------------------------------------------------------------------------

template<typename S>
struct State {
    explicit State(S initial) : current_(initial) {}

    S    current() const            { return current_; }
    bool is(S s) const              { return current_ == s; }
    void set(S next)                { next_ = next; }
    const std::optional<S>& next() const { return next_; }

private:
    template<typename> friend class StateSystem;

    S                current_;
    std::optional<S> next_;
    bool             announced_ = false;
};

// from is empty only for the announcement of the initial state.
template<typename S>
struct StateTransition {
    std::optional<S> from;
    S                to;
};

// ---------------------------------------------------------------------------
// StateSystem<S> — Pre-Update system; must run after the event flush.
// ---------------------------------------------------------------------------

template<typename S>
class StateSystem {
public:
    static void Update(ecs::World& world) {
        auto* state = world.try_resource<State<S>>();
        if (!state) return;

        if (!state->announced_) {
            state->announced_ = true;
            send_event(world, StateTransition<S>{std::nullopt, state->current_});
        }

        if (!state->next_) return;
        S next = *state->next_;
        state->next_.reset();
        if (next == state->current_) return;

        S previous = state->current_;
        state->current_ = next;
        std::cout << "[State] transition " << static_cast<int>(previous)
                  << " -> " << static_cast<int>(next) << std::endl;
        send_event(world, StateTransition<S>{previous, next});
    }
};

// True if this frame's transitions entered s.
template<typename S>
inline bool entered_state(ecs::World& world, S s) {
    const auto* q = world.try_resource<Events<StateTransition<S>>>();
    if (!q) return false;
    for (const auto& t : q->read()) {
        if (t.to == s) return true;
    }
    return false;
}

// True if this frame's transitions exited s.
template<typename S>
inline bool exited_state(ecs::World& world, S s) {
    const auto* q = world.try_resource<Events<StateTransition<S>>>();
    if (!q) return false;
    for (const auto& t : q->read()) {
        if (t.from && *t.from == s) return true;
    }
    return false;
}
