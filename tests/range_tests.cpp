#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/errors.hpp"
#include "../src/events.hpp"
#include "../src/health.hpp"
#include "../src/math_util.hpp"
#include "../src/range.hpp"
#include <ecs/ecs.hpp>
#include <limits>

using Catch::Matchers::WithinAbs;

struct StaminaTag {};
using Stamina = Range<StaminaTag>;

// World with the health and stamina event queues installed.
static void install_range_queues(ecs::World& world) {
    world.set_resource(EventRegistry{});
    auto& reg = world.resource<EventRegistry>();
    reg.register_queue<DeathEvent>(world);
    reg.register_queue<FullHealEvent>(world);
    reg.register_queue<RangeMinReached<StaminaTag>>(world);
    reg.register_queue<RangeMaxReached<StaminaTag>>(world);
}

// ---------------------------------------------------------------------------
// quantize
// ---------------------------------------------------------------------------

TEST_CASE("quantize — rounds to nearest step", "[math]") {
    using toolbox::math::quantize;
    CHECK_THAT(quantize(7.4f, 1.0f),  WithinAbs(7.0f, 1e-5f));
    CHECK_THAT(quantize(7.5f, 1.0f),  WithinAbs(8.0f, 1e-5f));
    CHECK_THAT(quantize(0.26f, 0.25f), WithinAbs(0.25f, 1e-5f));
    CHECK_THAT(quantize(-2.6f, 0.5f), WithinAbs(-2.5f, 1e-5f));
}

TEST_CASE("quantize — zero step leaves value untouched", "[math]") {
    CHECK(toolbox::math::quantize(3.14159f, 0.0f) == 3.14159f);
}

// ---------------------------------------------------------------------------
// Range<Tag> — value semantics
// ---------------------------------------------------------------------------

TEST_CASE("Range — set inside bounds is Ok", "[range]") {
    Health h(0.0f, 100.0f, 50.0f);
    auto r = h.set(60.0f);
    CHECK(r.ok());
    CHECK_FALSE(r.entered);
    CHECK(h.raw() == 60.0f);
}

TEST_CASE("Range — add past max clamps and reports Max", "[range]") {
    Health h(0.0f, 100.0f, 90.0f);
    auto r = h.add(20.0f);
    CHECK(r.limit == RangeLimit::Max);
    CHECK(r.entered);
    CHECK_THAT(r.requested, WithinAbs(110.0f, 1e-5f));
    CHECK(h.raw() == 100.0f);
}

TEST_CASE("Range — value exactly at a bound counts as reaching it", "[range]") {
    Health h(0.0f, 100.0f, 50.0f);
    CHECK(h.set(0.0f).limit == RangeLimit::Min);
    CHECK(h.set(100.0f).limit == RangeLimit::Max);
}

TEST_CASE("Range — add below min clamps and reports Min", "[range]") {
    Health h(0.0f, 100.0f, 5.0f);
    auto r = h.add(-30.0f);
    CHECK(r.limit == RangeLimit::Min);
    CHECK(r.entered);
    CHECK_THAT(r.requested, WithinAbs(-25.0f, 1e-5f));
    CHECK(h.raw() == 0.0f);
}

TEST_CASE("Range — staying pinned does not re-enter the bound", "[range]") {
    Health h(0.0f, 100.0f, 10.0f);
    CHECK(h.add(-20.0f).entered);
    auto again = h.add(-5.0f);
    CHECK(again.limit == RangeLimit::Min);
    CHECK_FALSE(again.entered);
}

TEST_CASE("Range — leaving a bound re-arms it", "[range]") {
    Health h(0.0f, 100.0f, 10.0f);
    CHECK(h.add(-20.0f).entered);
    CHECK(h.add(5.0f).ok());
    CHECK(h.add(-10.0f).entered);
}

TEST_CASE("Range — jumping from one bound to the other enters it", "[range]") {
    Health h(0.0f, 100.0f, 0.0f);
    CHECK(h.resting_limit() == RangeLimit::Min);
    auto r = h.set(150.0f);
    CHECK(r.limit == RangeLimit::Max);
    CHECK(r.entered);
}

TEST_CASE("Range — created at a bound does not report it", "[range]") {
    Health full(0.0f, 100.0f);
    CHECK(full.raw() == 100.0f);
    CHECK(full.resting_limit() == RangeLimit::Max);
    CHECK_FALSE(full.add(10.0f).entered);
}

TEST_CASE("Range — starting value outside the bounds is clamped", "[range]") {
    Health h(0.0f, 100.0f, 250.0f);
    CHECK(h.raw() == 100.0f);
    Health low(10.0f, 20.0f, -5.0f);
    CHECK(low.raw() == 10.0f);
}

TEST_CASE("Range — min greater than max throws ConfigError", "[range]") {
    CHECK_THROWS_AS(Health(10.0f, 0.0f, 5.0f), ConfigError);
}

TEST_CASE("Range — NaN bounds or starting value throw ConfigError", "[range]") {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    CHECK_THROWS_AS(Health(nan, 100.0f, 50.0f), ConfigError);
    CHECK_THROWS_AS(Health(0.0f, nan, 50.0f), ConfigError);
    CHECK_THROWS_AS(Health(0.0f, 100.0f, nan), ConfigError);
}

TEST_CASE("Range — NaN mutation leaves value and latch untouched", "[range]") {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    Health h(0.0f, 100.0f, 40.0f);
    auto r = h.set(nan);
    CHECK(r.ok());
    CHECK_FALSE(r.entered);
    CHECK(h.raw() == 40.0f);

    CHECK(h.add(-50.0f).entered);
    auto pinned = h.add(nan);
    CHECK(pinned.limit == RangeLimit::Min);
    CHECK_FALSE(pinned.entered);
    CHECK(h.raw() == 0.0f);
    CHECK(h.add(10.0f).ok());
}

TEST_CASE("Range — degenerate range is always at both bounds", "[range]") {
    Health h(5.0f, 5.0f, 5.0f);
    auto r = h.set(7.0f);
    CHECK(h.raw() == 5.0f);
    CHECK(r.limit != RangeLimit::None);
}

TEST_CASE("Range — get() applies the quantize step", "[range]") {
    Health h(0.0f, 100.0f, 42.4f);
    h.with_quantize(5.0f);
    CHECK_THAT(h.get(), WithinAbs(40.0f, 1e-5f));
    CHECK_THAT(h.raw(), WithinAbs(42.4f, 1e-5f));
    h.set_quantize(0.0f);
    CHECK_THAT(h.get(), WithinAbs(42.4f, 1e-5f));
}

TEST_CASE("Range — negative quantize step throws", "[range]") {
    Health h(0.0f, 1.0f);
    CHECK_THROWS_AS(h.set_quantize(-1.0f), ConfigError);
}

// ---------------------------------------------------------------------------
// RangeSystem<Tag> — events
// ---------------------------------------------------------------------------

TEST_CASE("RangeSystem — modify at 90 by +20 emits one max event", "[range][events]") {
    ecs::World world;
    install_range_queues(world);
    auto e = world.create();
    world.add(e, Health(0.0f, 100.0f, 90.0f));

    REQUIRE(HealthSystem::modify(world, e, 20.0f));

    const auto& max_events = world.resource<Events<FullHealEvent>>().read();
    REQUIRE(max_events.size() == 1);
    CHECK(max_events[0].entity == e);
    CHECK_THAT(max_events[0].requested, WithinAbs(110.0f, 1e-5f));
    CHECK(world.resource<Events<DeathEvent>>().empty());
    CHECK(world.try_get<Health>(e)->raw() == 100.0f);
}

TEST_CASE("RangeSystem — repeated pinned mutations emit once", "[range][events]") {
    ecs::World world;
    install_range_queues(world);
    auto e = world.create();
    world.add(e, Health(0.0f, 100.0f, 10.0f));

    HealthSystem::modify(world, e, -50.0f);
    HealthSystem::modify(world, e, -50.0f);
    HealthSystem::assign(world, e, -1.0f);

    CHECK(world.resource<Events<DeathEvent>>().read().size() == 1);
}

TEST_CASE("RangeSystem — modify without a Range returns false", "[range]") {
    ecs::World world;
    install_range_queues(world);
    auto e = world.create();
    CHECK_FALSE(HealthSystem::modify(world, e, 1.0f));
    CHECK(world.resource<Events<DeathEvent>>().empty());
}

TEST_CASE("RangeSystem — tags keep event queues apart", "[range][events]") {
    ecs::World world;
    install_range_queues(world);
    auto e = world.create();
    world.add(e, Health(0.0f, 100.0f, 50.0f));
    world.add(e, Stamina(0.0f, 10.0f, 1.0f));

    RangeSystem<StaminaTag>::modify(world, e, -5.0f);

    CHECK(world.resource<Events<RangeMinReached<StaminaTag>>>().read().size() == 1);
    CHECK(world.resource<Events<DeathEvent>>().empty());
    CHECK(world.try_get<Health>(e)->raw() == 50.0f);
}

TEST_CASE("RangeSystem — Update applies change_per_second", "[range]") {
    ecs::World world;
    install_range_queues(world);
    auto e = world.create();
    Stamina s(0.0f, 10.0f, 8.0f);
    s.with_change_per_second(2.0f);
    world.add(e, s);

    RangeSystem<StaminaTag>::Update(world, 0.5f);
    CHECK_THAT(world.try_get<Stamina>(e)->raw(), WithinAbs(9.0f, 1e-5f));
    CHECK(world.resource<Events<RangeMaxReached<StaminaTag>>>().empty());

    RangeSystem<StaminaTag>::Update(world, 1.0f);
    CHECK(world.try_get<Stamina>(e)->raw() == 10.0f);
    CHECK(world.resource<Events<RangeMaxReached<StaminaTag>>>().read().size() == 1);
}

TEST_CASE("RangeSystem — negative rate drains to min", "[range]") {
    ecs::World world;
    install_range_queues(world);
    auto e = world.create();
    Health h(0.0f, 100.0f, 1.0f);
    h.with_change_per_second(-4.0f);
    world.add(e, h);

    RangeSystem<HealthMarker>::Update(world, 1.0f);
    CHECK(world.try_get<Health>(e)->raw() == 0.0f);
    CHECK(world.resource<Events<DeathEvent>>().read().size() == 1);
}
