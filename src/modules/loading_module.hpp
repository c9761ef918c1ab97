#pragma once
#include "../assets.hpp"
#include "../debug_panel.hpp"
#include "../events.hpp"
#include "../loading.hpp"
#include "../pipeline.hpp"
#include <ecs/ecs.hpp>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// LoadingModule<R, S>
//
// Loads every slot of `manifest` while State<S> is `loading` and publishes R
// once all of them are Loaded. The state moves to `target` when every loader
// installed for `loading` is done. Registers AssetLoadFailed, stores the
// asset server as std::shared_ptr<IAssetServer> (unless one is already
// installed), and adds AssetServerSystem and AssetLoaderSystem<R, S> to the
// Logic phase. Requires StateModule<S>, installed before this module.
// ---------------------------------------------------------------------------

template<typename R, typename S>
struct LoadingModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline,
                        std::shared_ptr<IAssetServer> server,
                        LoadingManifest<R> manifest, S loading, S target) {
        if (!world.try_resource<std::shared_ptr<IAssetServer>>()) {
            world.set_resource(std::move(server));
            pipeline.add_logic([](ecs::World& w, float) { AssetServerSystem::Update(w); });
        }
        if (!world.try_resource<LoadingProgress<S>>()) {
            pipeline.add_pre_update([](ecs::World& w, float) { LoadingProgressSystem<S>::Update(w); });
        }
        add_asset_loader<R, S>(world, std::move(manifest), loading, target);
        world.resource<EventRegistry>().register_queue<AssetLoadFailed>(world);
        pipeline.add_logic([](ecs::World& w, float) { AssetLoaderSystem<R, S>::Update(w); });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Loading", "Progress", [&world, loading]() {
                auto* progress = world.try_resource<LoadingProgress<S>>();
                if (!progress) return std::string("-");
                if (progress->failed(loading)) return std::string("Failed");
                return std::to_string(progress->loaded(loading)) + " / " +
                       std::to_string(progress->total(loading));
            });
        }
    }
};
