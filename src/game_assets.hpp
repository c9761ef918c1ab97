#pragma once
#include "assets.hpp"
#include "loading.hpp"

// Textures the arena needs before play can start. Published by the loader
// once every handle is Loaded.
struct GameTextures {
    AssetHandle ducky = kInvalidAsset;
    AssetHandle crate = kInvalidAsset;
};

// Default slots; paths may be overridden from the config "assets" object.
inline LoadingManifest<GameTextures> game_texture_manifest() {
    LoadingManifest<GameTextures> manifest;
    manifest.add("ducky", "resources/textures/ducky.png", &GameTextures::ducky)
            .add("crate", "resources/textures/crate.png", &GameTextures::crate);
    return manifest;
}
