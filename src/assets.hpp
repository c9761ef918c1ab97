#pragma once
#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// Asset server interface
//
// The host's asset pipeline, seen from the loader: request a path, get a
// handle back immediately, poll its status every frame. Implementations may
// finish loads synchronously, incrementally in poll(), or on another thread.
//
// Stored in the World as std::shared_ptr<IAssetServer>.
// ---------------------------------------------------------------------------

using AssetHandle = uint32_t;
inline constexpr AssetHandle kInvalidAsset = 0;

enum class AssetStatus { Loading, Loaded, Failed };

class IAssetServer {
public:
    virtual ~IAssetServer() = default;

    // Starts loading path and returns its handle. Never returns kInvalidAsset.
    virtual AssetHandle load(const std::string& path) = 0;

    virtual AssetStatus status(AssetHandle handle) const = 0;

    // Advances pending loads. Called once per frame by AssetServerSystem.
    virtual void poll() {}
};

inline const char* to_string(AssetStatus status) {
    switch (status) {
        case AssetStatus::Loading: return "Loading";
        case AssetStatus::Loaded:  return "Loaded";
        case AssetStatus::Failed:  return "Failed";
    }
    return "?";
}
