#include "despawn.hpp"
#include "../errors.hpp"
#include <string>
#include <vector>

using namespace ecs;

AutoDespawn AutoDespawn::after_seconds(float seconds) {
    if (seconds < 0.0f) {
        throw ConfigError("AutoDespawn: duration must not be negative (" +
                          std::to_string(seconds) + ")");
    }
    AutoDespawn d;
    d.mode = Mode::Timer;
    d.duration = seconds;
    return d;
}

AutoDespawn AutoDespawn::after_frames(uint32_t frames) {
    AutoDespawn d;
    d.mode = Mode::Frames;
    d.frames = frames;
    return d;
}

bool DespawnSystem::tick(AutoDespawn& despawn, float dt) {
    if (despawn.state == AutoDespawn::State::Expired) return false;

    switch (despawn.mode) {
        case AutoDespawn::Mode::Timer:
            despawn.elapsed += dt;
            if (despawn.elapsed < despawn.duration) return false;
            break;
        case AutoDespawn::Mode::Frames:
            if (despawn.frames > 0) {
                despawn.frames--;
                return false;
            }
            break;
    }

    despawn.state = AutoDespawn::State::Expired;
    return true;
}

void DespawnSystem::Update(World& world, float dt) {
    std::vector<Entity> expired;
    world.each<AutoDespawn>([&](Entity e, AutoDespawn& despawn) {
        if (tick(despawn, dt)) expired.push_back(e);
    });

    if (expired.empty()) return;
    for (auto e : expired) world.destroy(e);
    world.deferred().flush(world);
}
