#include "renderer.hpp"
#include "../components.hpp"
#include "../texture_server.hpp"
#include <ecs/modules/transform.hpp>
#include <raylib.h>
#include <raymath.h>
#include <rlgl.h>
#include <algorithm>
#include <memory>
#include <vector>

using namespace ecs;

// Convert our engine Color4 to Raylib's Color at draw time.
static inline Color to_raylib(const Color4& c) {
    return Color{
        static_cast<unsigned char>(c.r * 255.0f),
        static_cast<unsigned char>(c.g * 255.0f),
        static_cast<unsigned char>(c.b * 255.0f),
        static_cast<unsigned char>(c.a * 255.0f),
    };
}

static inline Vector3 to_raylib(const ecs::Vec3& v) { return {v.x, v.y, v.z}; }

static Camera3D to_camera(const CameraView& view) {
    Camera3D camera = {};
    camera.position   = to_raylib(view.position);
    camera.target     = to_raylib(view.target);
    camera.up         = to_raylib(view.up);
    camera.fovy       = view.fovy;
    camera.projection = CAMERA_PERSPECTIVE;
    return camera;
}

static void draw_scene(World& world, const Camera3D& camera) {
    const TextureAssetServer* textures = nullptr;
    if (auto* server = world.try_resource<std::shared_ptr<TextureAssetServer>>()) textures = server->get();

    BeginMode3D(camera);
        DrawGrid(100, 2.0f);

        world.each<WorldTransform, MeshRenderer>(
            [&](Entity, WorldTransform& wt, MeshRenderer& mesh) {
                rlPushMatrix();
                rlMultMatrixf((float*)&wt.matrix);
                rlScalef(mesh.scale_offset.x, mesh.scale_offset.y, mesh.scale_offset.z);
                Color col = to_raylib(mesh.color);
                switch (mesh.shape_type) {
                    case ShapeType::Box:     DrawCube({0,0,0}, 1.0f, 1.0f, 1.0f, col); break;
                    case ShapeType::Sphere:  DrawSphere({0,0,0}, 0.5f, col);            break;
                    case ShapeType::Capsule: DrawCapsule({0,-0.5f,0}, {0, 0.5f, 0}, 0.4f, 8, 8, col); break;
                }
                rlPopMatrix();
            });

        if (textures) {
            world.each<WorldTransform, Sprite>([&](Entity, WorldTransform& wt, Sprite& sprite) {
                const Texture2D* tex = textures->texture(sprite.texture);
                if (!tex) return;
                Vector3 pos = {wt.matrix.m[12], wt.matrix.m[13], wt.matrix.m[14]};
                DrawBillboard(camera, *tex, pos, sprite.size, to_raylib(sprite.tint));
            });
        }
    EndMode3D();
}

void RenderSystem::Register(World& world) {
    world.on_remove<ViewTarget>([](World&, Entity, ViewTarget& target) {
        if (target.texture.id != 0) UnloadRenderTexture(target.texture);
        target.texture = {};
    });
}

void RenderSystem::Update(World& world) {
    struct Pass {
        Entity entity;
        CameraView view;
    };

    std::vector<Pass> passes;
    world.each<CameraView>([&](Entity e, CameraView& view) {
        if (view.active && view.viewport.width > 0 && view.viewport.height > 0) passes.push_back({e, view});
    });
    std::stable_sort(passes.begin(), passes.end(),
                     [](const Pass& a, const Pass& b) { return a.view.order < b.view.order; });

    // 1. Render each camera offscreen
    for (auto& pass : passes) {
        const Viewport& vp = pass.view.viewport;
        auto* target = world.try_get<ViewTarget>(pass.entity);
        if (!target) {
            world.add(pass.entity, ViewTarget{});
            target = world.try_get<ViewTarget>(pass.entity);
        }
        if (target->width != vp.width || target->height != vp.height) {
            if (target->texture.id != 0) UnloadRenderTexture(target->texture);
            target->texture = LoadRenderTexture(vp.width, vp.height);
            target->width = vp.width;
            target->height = vp.height;
        }

        BeginTextureMode(target->texture);
            ClearBackground({35, 35, 40, 255});
            draw_scene(world, to_camera(pass.view));
        EndTextureMode();
    }

    // 2. Compose
    BeginDrawing();
    ClearBackground(BLACK);

    if (passes.empty()) {
        CameraView overview;
        draw_scene(world, to_camera(overview));
        return;
    }

    for (auto& pass : passes) {
        const auto* target = world.try_get<ViewTarget>(pass.entity);
        if (!target) continue;
        const Viewport& vp = pass.view.viewport;
        // Render textures are stored upside down.
        Rectangle src = {0, 0, static_cast<float>(target->width), -static_cast<float>(target->height)};
        DrawTextureRec(target->texture.texture, src,
                       {static_cast<float>(vp.x), static_cast<float>(vp.y)}, WHITE);
    }
}

void RenderSystem::Present(World&) {
    EndDrawing();
}

void RenderSystem::Shutdown(World& world) {
    world.each<ViewTarget>([](Entity, ViewTarget& target) {
        if (target.texture.id != 0) UnloadRenderTexture(target.texture);
        target.texture = {};
        target.width = 0;
        target.height = 0;
    });
}
