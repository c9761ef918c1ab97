#pragma once
#include "assets.hpp"
#include <raylib.h>
#include <deque>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// TextureAssetServer — raylib-backed IAssetServer for textures.
//
// load() only queues the path; poll() uploads one queued texture per frame so
// the loading screen keeps drawing. A texture with id 0 (missing or
// undecodable file) is reported as Failed.
//
// Needs a live GL context: create after InitWindow, unload_all() before
// CloseWindow.
// ---------------------------------------------------------------------------

class TextureAssetServer : public IAssetServer {
public:
    AssetHandle load(const std::string& path) override;
    AssetStatus status(AssetHandle handle) const override;
    void poll() override;

    // Loaded texture for handle, or nullptr if it is not (yet) loaded.
    const Texture2D* texture(AssetHandle handle) const;

    void unload_all();

private:
    struct Entry {
        std::string path;
        AssetStatus status = AssetStatus::Loading;
        Texture2D texture = {};
    };

    // Handle h lives at entries_[h - 1].
    std::vector<Entry> entries_;
    std::deque<AssetHandle> queue_;
};
