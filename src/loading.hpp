#pragma once
#include "app_state.hpp"
#include "assets.hpp"
#include "errors.hpp"
#include "events.hpp"
#include <ecs/ecs.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// Batch asset loading during a loading state.
//
// R is a plain struct of AssetHandle members. A LoadingManifest<R> names
// each slot, the path to load, and the member that receives the handle, so
// the target resource is filled without any runtime field lookup.
//
// When every handle reports Loaded, R is published as a World resource.
// Several loaders may share one loading state; each reports into
// LoadingProgress<S>, and State<S> is asked to move to the target state only
// once every loader of that state is Ready. Any Failed handle stops its
// loader for good: R is never published, AssetLoadFailed is sent and the
// state never leaves the loading state.
// ---------------------------------------------------------------------------

template<typename R>
struct AssetSlot {
    std::string name;
    std::string path;
    AssetHandle R::* field;
};

template<typename R>
struct LoadingManifest {
    std::vector<AssetSlot<R>> slots;

    LoadingManifest& add(std::string name, std::string path, AssetHandle R::* field) {
        slots.push_back({std::move(name), std::move(path), field});
        return *this;
    }

    const AssetSlot<R>* find(const std::string& name) const {
        for (const auto& s : slots) {
            if (s.name == name) return &s;
        }
        return nullptr;
    }

    // Replaces the path of an existing slot. Unknown names are a config error.
    void set_path(const std::string& name, const std::string& path) {
        for (auto& s : slots) {
            if (s.name == name) { s.path = path; return; }
        }
        throw ConfigError("LoadingManifest: no asset slot named '" + name + "'");
    }
};

namespace loading {
    struct Idle {};
    struct Loading {
        size_t loaded = 0;  // handles that reported Loaded on the last check
    };
    struct Ready {};
    struct Failed {
        std::string slot;
        std::string path;
    };
    using Phase = std::variant<Idle, Loading, Ready, Failed>;
}

// Sent once when an asset fails to load. The loader stays in Failed.
struct AssetLoadFailed {
    std::string slot;
    std::string path;
};

// ---------------------------------------------------------------------------
// LoadingProgress<S> — combined tally of every loader (World resource).
//
// One batch per installed loader. All batches of a loading state must name
// the same target state.
// ---------------------------------------------------------------------------

template<typename S>
struct LoadingProgress {
    struct Batch {
        S      loading;
        S      target;
        size_t loaded = 0;
        size_t total  = 0;
        bool   ready  = false;
        bool   failed = false;
    };

    std::vector<Batch> batches;

    // Returns the batch index. Throws ConfigError on a conflicting target.
    size_t add(S loading, S target, size_t total) {
        for (const auto& b : batches) {
            if (b.loading == loading && b.target != target) {
                throw ConfigError("LoadingProgress: loaders of one state must share a target state");
            }
        }
        batches.push_back({loading, target, 0, total, false, false});
        return batches.size() - 1;
    }

    void reset(S loading) {
        for (auto& b : batches) {
            if (b.loading != loading) continue;
            b.loaded = 0;
            b.ready = false;
            b.failed = false;
        }
    }

    size_t loaded(S loading) const {
        size_t n = 0;
        for (const auto& b : batches) if (b.loading == loading) n += b.loaded;
        return n;
    }

    size_t total(S loading) const {
        size_t n = 0;
        for (const auto& b : batches) if (b.loading == loading) n += b.total;
        return n;
    }

    bool failed(S loading) const {
        for (const auto& b : batches) if (b.loading == loading && b.failed) return true;
        return false;
    }

    // True when the state has at least one loader and all of them are Ready.
    bool complete(S loading) const {
        bool any = false;
        for (const auto& b : batches) {
            if (b.loading != loading) continue;
            if (!b.ready) return false;
            any = true;
        }
        return any;
    }
};

// Loader bookkeeping for one target resource (stored as a World resource).
template<typename R, typename S>
struct AssetLoader {
    AssetLoader(LoadingManifest<R> m, S loading, S target, size_t batch_index)
        : manifest(std::move(m)), loading_state(loading), target_state(target), batch(batch_index) {}

    LoadingManifest<R> manifest;
    S                  loading_state;
    S                  target_state;
    size_t             batch;
    R                  staged{};
    loading::Phase     phase = loading::Idle{};

    size_t total() const { return manifest.slots.size(); }

    size_t loaded() const {
        if (std::holds_alternative<loading::Ready>(phase)) return total();
        if (auto* l = std::get_if<loading::Loading>(&phase)) return l->loaded;
        return 0;
    }

    bool is_ready()  const { return std::holds_alternative<loading::Ready>(phase); }
    bool is_failed() const { return std::holds_alternative<loading::Failed>(phase); }
};

// Registers a loader for R with LoadingProgress<S>, creating the tally on
// first use, and stores it as a World resource.
template<typename R, typename S>
void add_asset_loader(ecs::World& world, LoadingManifest<R> manifest, S loading, S target) {
    if (!world.try_resource<LoadingProgress<S>>()) world.set_resource(LoadingProgress<S>{});
    const size_t batch = world.resource<LoadingProgress<S>>().add(loading, target, manifest.slots.size());
    world.set_resource(AssetLoader<R, S>{std::move(manifest), loading, target, batch});
}

// ---------------------------------------------------------------------------
// LoadingProgressSystem<S> — Pre-Update, after StateSystem<S>.
//
// Clears the batches of a loading state on entering it, so a loader that
// finishes early in that frame never sees another loader's result from an
// earlier visit.
// ---------------------------------------------------------------------------

template<typename S>
class LoadingProgressSystem {
public:
    static void Update(ecs::World& world) {
        auto* progress = world.try_resource<LoadingProgress<S>>();
        const auto* transitions = world.try_resource<Events<StateTransition<S>>>();
        if (!progress || !transitions) return;
        for (const auto& t : transitions->read()) progress->reset(t.to);
    }
};

// ---------------------------------------------------------------------------
// AssetServerSystem — advances the asset server once per frame.
// ---------------------------------------------------------------------------

class AssetServerSystem {
public:
    static void Update(ecs::World& world) {
        auto* server = world.try_resource<std::shared_ptr<IAssetServer>>();
        if (!server || !*server) return;
        (*server)->poll();
    }
};

// ---------------------------------------------------------------------------
// AssetLoaderSystem<R, S> — Logic-phase system.
// ---------------------------------------------------------------------------

template<typename R, typename S>
class AssetLoaderSystem {
public:
    static void Update(ecs::World& world) {
        auto* loader = world.try_resource<AssetLoader<R, S>>();
        auto* progress = world.try_resource<LoadingProgress<S>>();
        auto* server_ptr = world.try_resource<std::shared_ptr<IAssetServer>>();
        if (!loader || !progress || !server_ptr || !*server_ptr) return;
        if (loader->batch >= progress->batches.size()) return;
        IAssetServer& server = **server_ptr;
        auto& batch = progress->batches[loader->batch];

        if (entered_state(world, loader->loading_state)) begin(*loader, server);

        auto* state = world.try_resource<State<S>>();
        if (!state || !state->is(loader->loading_state)) return;

        auto* pending = std::get_if<loading::Loading>(&loader->phase);
        if (!pending) return;

        size_t loaded = 0;
        for (const auto& slot : loader->manifest.slots) {
            AssetHandle handle = loader->staged.*(slot.field);
            AssetStatus status = server.status(handle);
            if (status == AssetStatus::Failed) {
                std::cerr << "[Loading] Asset '" << slot.name << "' failed to load from "
                          << slot.path << std::endl;
                loader->phase = loading::Failed{slot.name, slot.path};
                batch.failed = true;
                send_event(world, AssetLoadFailed{slot.name, slot.path});
                return;
            }
            if (status == AssetStatus::Loaded) loaded++;
        }
        pending->loaded = loaded;
        batch.loaded = loaded;

        if (loaded < loader->total()) return;

        R published = loader->staged;
        loader->phase = loading::Ready{};
        batch.ready = true;
        if (progress->complete(loader->loading_state)) {
            std::cout << "[Loading] All assets were loaded successfully ("
                      << progress->total(loader->loading_state) << ")" << std::endl;
            state->set(loader->target_state);
        }
        // Inserting a resource may move existing ones; loader/state/progress are not used past here.
        world.set_resource(std::move(published));
    }

private:
    static void begin(AssetLoader<R, S>& loader, IAssetServer& server) {
        loader.staged = R{};
        for (const auto& slot : loader.manifest.slots) {
            loader.staged.*(slot.field) = server.load(slot.path);
            std::cout << "[Loading] Start loading " << slot.name << " (" << slot.path << ")"
                      << std::endl;
        }
        loader.phase = loading::Loading{};
    }
};
