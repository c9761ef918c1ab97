#include "collision.hpp"
#include <utility>

using namespace ecs;

size_t CollisionBridgeSystem::translate(World& world, const std::vector<RawContact>& contacts) {
    const auto* registry = world.try_resource<BodyRegistry>();
    if (!registry) return 0;

    size_t sent = 0;
    for (const auto& c : contacts) {
        const Entity* a = registry->find(c.body_a);
        const Entity* b = registry->find(c.body_b);
        // Either body may already be gone (entity destroyed mid-frame).
        if (!a || !b) continue;

        if (c.started) send_event(world, CollisionStarted{*a, *b});
        else           send_event(world, CollisionStopped{*a, *b});
        sent++;
    }
    return sent;
}

void CollisionBridgeSystem::Update(World& world) {
    auto* buffer = world.try_resource<ContactBuffer>();
    if (!buffer || buffer->contacts.empty()) return;

    std::vector<RawContact> contacts = std::move(buffer->contacts);
    buffer->contacts.clear();
    translate(world, contacts);
}
