#pragma once
#include "errors.hpp"
#include "events.hpp"
#include "math_util.hpp"
#include <ecs/ecs.hpp>
#include <cmath>
#include <string>

// ---------------------------------------------------------------------------
// Range<Tag> — a float clamped to [min, max], attached as a component.
//
// The Tag parameter keeps unrelated ranges apart (health, stamina, an axis
// position) so each gets its own component type and event queues.
//
// Boundary policy: set()/add() pin values at or beyond a bound to that bound.
// The range remembers the bound it is resting on; a mutation only counts as
// "entered" when it moves onto a bound from inside or from the other bound.
// Staying pinned does not re-enter, leaving a bound re-arms it. A NaN
// bound or starting value is a ConfigError; set()/add() ignore a NaN result.
// ---------------------------------------------------------------------------

enum class RangeLimit { None, Min, Max };

struct ModifyRangeResult {
    RangeLimit limit     = RangeLimit::None; // bound the value was pinned to
    float      requested = 0.0f;             // unclamped value
    bool       entered   = false;            // first mutation onto this bound

    bool ok() const { return limit == RangeLimit::None; }
};

template<typename Tag>
class Range {
public:
    Range() : Range(0.0f, 1.0f) {}
    Range(float min, float max) : Range(min, max, max) {}

    Range(float min, float max, float current) : min_(min), max_(max) {
        if (std::isnan(min) || std::isnan(max) || std::isnan(current)) {
            throw ConfigError("Range: bounds and starting value must be numbers");
        }
        if (min > max) {
            throw ConfigError("Range: min (" + std::to_string(min) +
                              ") is greater than max (" + std::to_string(max) + ")");
        }
        current_ = current;
        resting_ = classify(current);
        if (resting_ == RangeLimit::Min) current_ = min_;
        if (resting_ == RangeLimit::Max) current_ = max_;
    }

    // Builder-style setters, for use at construction time.
    Range& with_quantize(float step)           { set_quantize(step); return *this; }
    Range& with_change_per_second(float rate)  { change_per_second_ = rate; return *this; }

    ModifyRangeResult set(float value) {
        ModifyRangeResult result;
        result.requested = value;
        if (std::isnan(value)) {
            result.limit = resting_;
            return result;
        }
        result.limit     = classify(value);

        switch (result.limit) {
            case RangeLimit::Min:  current_ = min_;  break;
            case RangeLimit::Max:  current_ = max_;  break;
            case RangeLimit::None: current_ = value; break;
        }

        result.entered = (result.limit != RangeLimit::None && result.limit != resting_);
        resting_ = result.limit;
        return result;
    }

    ModifyRangeResult add(float delta) { return set(current_ + delta); }

    // Current value rounded to the quantize step (unrounded if step is 0).
    float get() const { return toolbox::math::quantize(current_, quantize_); }
    float raw() const { return current_; }

    float min() const { return min_; }
    float max() const { return max_; }
    RangeLimit resting_limit() const { return resting_; }

    float quantize_step() const { return quantize_; }
    void  set_quantize(float step) {
        if (step < 0.0f) throw ConfigError("Range: quantize step must not be negative");
        quantize_ = step;
    }

    float change_per_second() const         { return change_per_second_; }
    void  set_change_per_second(float rate) { change_per_second_ = rate; }

private:
    RangeLimit classify(float value) const {
        if (value <= min_) return RangeLimit::Min;
        if (value >= max_) return RangeLimit::Max;
        return RangeLimit::None;
    }

    float      min_;
    float      max_;
    float      current_           = 0.0f;
    float      quantize_          = 0.0f;
    float      change_per_second_ = 0.0f;
    RangeLimit resting_           = RangeLimit::None;
};

// ---------------------------------------------------------------------------
// Boundary events — one frame lifetime, one queue per Tag and bound.
// ---------------------------------------------------------------------------

template<typename Tag>
struct RangeMinReached {
    ecs::Entity entity;
    float       requested;
};

template<typename Tag>
struct RangeMaxReached {
    ecs::Entity entity;
    float       requested;
};

// ---------------------------------------------------------------------------
// RangeSystem<Tag> — Logic-phase system.
//
// Update() applies change_per_second to every Range<Tag>. modify()/assign()
// are the entry points for other systems (damage, healing) so that their
// boundary crossings reach the same event queues.
// ---------------------------------------------------------------------------

template<typename Tag>
class RangeSystem {
public:
    static void Update(ecs::World& world, float dt) {
        world.each<Range<Tag>>([&](ecs::Entity e, Range<Tag>& range) {
            if (range.change_per_second() == 0.0f) return;
            publish(world, e, range.add(range.change_per_second() * dt));
        });
    }

    // Returns false if the entity has no Range<Tag>.
    static bool modify(ecs::World& world, ecs::Entity e, float delta) {
        auto* range = world.try_get<Range<Tag>>(e);
        if (!range) return false;
        publish(world, e, range->add(delta));
        return true;
    }

    static bool assign(ecs::World& world, ecs::Entity e, float value) {
        auto* range = world.try_get<Range<Tag>>(e);
        if (!range) return false;
        publish(world, e, range->set(value));
        return true;
    }

    static void publish(ecs::World& world, ecs::Entity e, const ModifyRangeResult& result) {
        if (!result.entered) return;
        if (result.limit == RangeLimit::Min) {
            send_event(world, RangeMinReached<Tag>{e, result.requested});
        } else if (result.limit == RangeLimit::Max) {
            send_event(world, RangeMaxReached<Tag>{e, result.requested});
        }
    }
};
