#pragma once
#include "../pipeline.hpp"
#include "../systems/renderer.hpp"
#include "../texture_server.hpp"
#include <ecs/ecs.hpp>
#include <memory>

// ---------------------------------------------------------------------------
// RenderModule
//
// Creates the TextureAssetServer resource the renderer resolves sprites
// through, installs the ViewTarget hooks, and adds RenderSystem to the
// Render phase. Hand the same server to LoadingModule to load textures.
//
// install_present() closes the frame and must be the last Render step, so
// call it after DebugModule and any HUD.
// shutdown() must be called before CloseWindow() to unload GPU resources.
// ---------------------------------------------------------------------------

struct RenderModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        auto textures = std::make_shared<TextureAssetServer>();
        world.set_resource(textures);
        RenderSystem::Register(world);
        pipeline.add_render([](ecs::World& w, float) { RenderSystem::Update(w); });
    }

    static void install_present(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_render([](ecs::World& w, float) { RenderSystem::Present(w); });
    }

    static void shutdown(ecs::World& world) {
        RenderSystem::Shutdown(world);
        if (auto* textures = world.try_resource<std::shared_ptr<TextureAssetServer>>()) {
            (*textures)->unload_all();
        }
    }
};
