#include "texture_server.hpp"
#include <iostream>

AssetHandle TextureAssetServer::load(const std::string& path) {
    entries_.push_back(Entry{path});
    AssetHandle handle = static_cast<AssetHandle>(entries_.size());
    queue_.push_back(handle);
    return handle;
}

AssetStatus TextureAssetServer::status(AssetHandle handle) const {
    if (handle == kInvalidAsset || handle > entries_.size()) return AssetStatus::Failed;
    return entries_[handle - 1].status;
}

void TextureAssetServer::poll() {
    if (queue_.empty()) return;
    AssetHandle handle = queue_.front();
    queue_.pop_front();

    Entry& entry = entries_[handle - 1];
    entry.texture = LoadTexture(entry.path.c_str());
    if (entry.texture.id == 0) {
        std::cerr << "[Assets] Could not load texture " << entry.path << std::endl;
        entry.status = AssetStatus::Failed;
        return;
    }
    entry.status = AssetStatus::Loaded;
}

const Texture2D* TextureAssetServer::texture(AssetHandle handle) const {
    if (status(handle) != AssetStatus::Loaded) return nullptr;
    return &entries_[handle - 1].texture;
}

void TextureAssetServer::unload_all() {
    for (auto& entry : entries_) {
        if (entry.status == AssetStatus::Loaded) UnloadTexture(entry.texture);
    }
    entries_.clear();
    queue_.clear();
}
