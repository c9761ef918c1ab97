#include "physics.hpp"
#include "collision.hpp"
#include "../components.hpp"
#include "../physics_handles.hpp"
#include "../physics_context.hpp"
#include <ecs/modules/transform.hpp>
#include <ecs/integration/glm.hpp>
#include <memory>

using namespace ecs;

void PhysicsSystem::Register(World& world) {
    if (!world.try_resource<BodyRegistry>()) world.set_resource(BodyRegistry{});
    if (!world.try_resource<ContactBuffer>()) world.set_resource(ContactBuffer{});

    world.on_add<RigidBodyConfig>([](World& w, Entity e, RigidBodyConfig& cfg) {
        if (w.has<RigidBodyHandle>(e)) return;

        auto* ctx_ptr = w.try_resource<std::shared_ptr<PhysicsContext>>();
        if (!ctx_ptr || !*ctx_ptr) return;
        auto& ctx = **ctx_ptr;

        JPH::BodyInterface& bi = ctx.GetBodyInterface();

        JPH::RefConst<JPH::Shape> shape;
        if (auto* box = w.try_get<BoxCollider>(e)) {
            shape = new JPH::BoxShape(MathBridge::ToJolt(box->half_extents));
        } else if (auto* sphere = w.try_get<SphereCollider>(e)) {
            shape = new JPH::SphereShape(sphere->radius);
        } else {
            shape = new JPH::BoxShape(JPH::Vec3(0.5f, 0.5f, 0.5f));
        }

        JPH::Vec3 pos = JPH::Vec3::sZero();
        JPH::Quat rot = JPH::Quat::sIdentity();

        // LocalTransform first; WorldTransform is identity until propagation runs.
        if (auto* lt = w.try_get<LocalTransform>(e)) {
            pos = MathBridge::ToJolt(lt->position);
            rot = MathBridge::ToJolt(lt->rotation);
        } else if (auto* wt = w.try_get<WorldTransform>(e)) {
            ecs::Vec3 p = { wt->matrix.m[12], wt->matrix.m[13], wt->matrix.m[14] };
            pos = MathBridge::ToJolt(p);
        }

        JPH::EMotionType motion = JPH::EMotionType::Dynamic;
        if (cfg.type == BodyType::Static) motion = JPH::EMotionType::Static;
        if (cfg.type == BodyType::Kinematic) motion = JPH::EMotionType::Kinematic;

        JPH::ObjectLayer layer = (cfg.type == BodyType::Static) ? Layers::NON_MOVING : Layers::MOVING;

        JPH::BodyCreationSettings settings(shape, pos, rot, motion, layer);
        settings.mRestitution = cfg.restitution;
        settings.mFriction = cfg.friction;
        settings.mIsSensor = cfg.sensor;
        if (cfg.type == BodyType::Dynamic && cfg.mass > 0.0f) {
            settings.mOverrideMassProperties = JPH::EOverrideMassProperties::CalculateInertia;
            settings.mMassPropertiesOverride.mMass = cfg.mass;
        }

        JPH::Body* body = bi.CreateBody(settings);
        if (!body) {
            std::cerr << "[Physics] Body limit reached; entity has no body" << std::endl;
            return;
        }
        bi.AddBody(body->GetID(), JPH::EActivation::Activate);

        RigidBodyHandle handle{body->GetID()};
        w.resource<BodyRegistry>().bind(handle.key(), e);
        w.add(e, handle);
    });

    world.on_remove<RigidBodyHandle>([](World& w, Entity, RigidBodyHandle& h) {
        if (auto* registry = w.try_resource<BodyRegistry>()) {
            registry->unbind(h.key());
        }
        auto* ctx_ptr = w.try_resource<std::shared_ptr<PhysicsContext>>();
        if (!ctx_ptr || !*ctx_ptr) return;
        JPH::BodyInterface& bi = (*ctx_ptr)->GetBodyInterface();
        bi.RemoveBody(h.id);
        bi.DestroyBody(h.id);
    });
}

void PhysicsSystem::Update(World& world, float dt) {
    auto* ctx_ptr = world.try_resource<std::shared_ptr<PhysicsContext>>();
    if (!ctx_ptr || !*ctx_ptr) return;
    auto& ctx = **ctx_ptr;

    JPH::BodyInterface& bi = ctx.GetBodyInterface();

    // Horizontal steering; gravity keeps the vertical component.
    world.each<RigidBodyHandle, MoveIntent>([&](Entity, RigidBodyHandle& h, MoveIntent& intent) {
        JPH::Vec3 v = bi.GetLinearVelocity(h.id);
        JPH::Vec3 wanted(intent.velocity.x, v.GetY(), intent.velocity.y);
        if (wanted != v) bi.SetLinearVelocity(h.id, wanted);
    });

    ctx.physics_system->Update(dt, 1, ctx.temp_allocator, ctx.job_system);

    world.each<RigidBodyHandle, WorldTransform, RigidBodyConfig>(
        [&](Entity e, RigidBodyHandle& h, WorldTransform& wt, RigidBodyConfig& cfg) {
            if (cfg.type != BodyType::Dynamic) return;

            JPH::RVec3 pos;
            JPH::Quat rot;
            bi.GetPositionAndRotation(h.id, pos, rot);

            ecs::Vec3 scale = {1, 1, 1};
            if (auto* lt = world.try_get<LocalTransform>(e)) {
                lt->position = MathBridge::FromJolt(pos);
                lt->rotation = MathBridge::FromJolt(rot);
                scale = lt->scale;
            }
            wt.matrix = mat4_compose(MathBridge::FromJolt(pos), MathBridge::FromJolt(rot), scale);
        });

    if (auto* buffer = world.try_resource<ContactBuffer>()) {
        ctx.contacts.drain(buffer->contacts);
    }
}
