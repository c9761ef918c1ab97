#pragma once
#include <ecs/ecs.hpp>
#include <raylib.h>

// Offscreen target of one CameraView. Created and resized by RenderSystem;
// the GPU texture is released when the component is removed.
struct ViewTarget {
    RenderTexture2D texture = {};
    int width = 0;
    int height = 0;
};

// ---------------------------------------------------------------------------
// RenderSystem
//
// Update() renders every active CameraView into its ViewTarget in ascending
// order, then opens the frame and composes the targets at their viewports.
// With no camera entities it falls back to a fixed overview camera on the
// whole window. Present() closes the frame; overlays (debug panel, HUD) are
// drawn between the two.
//
// Sprites are resolved through the TextureAssetServer resource and skipped
// until their texture is loaded.
// ---------------------------------------------------------------------------

class RenderSystem {
public:
    static void Register(ecs::World& world);
    static void Update(ecs::World& world);
    static void Present(ecs::World& world);

    // Releases every ViewTarget. Call before CloseWindow().
    static void Shutdown(ecs::World& world);
};
