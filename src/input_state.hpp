#pragma once
#include <ecs/modules/transform.hpp>

// ---------------------------------------------------------------------------
// InputRecord — raw keyboard/mouse snapshot for the current frame.
//
// Written by InputGatherSystem (raylib) at the start of each frame; read by
// InputMappingSystem and anything else that needs raw input. Key indices are
// raylib KeyboardKey codes. No raylib types here, so tests can fill it in.
// ---------------------------------------------------------------------------

inline constexpr int kMaxKeys = 512;

struct InputRecord {
    // Keyboard
    bool keys_down[kMaxKeys] = {false};      // held this frame
    bool keys_pressed[kMaxKeys] = {false};   // went down this frame
    bool keys_released[kMaxKeys] = {false};  // went up this frame

    // Mouse
    ecs::Vec2 mouse_pos = {0, 0};
    ecs::Vec2 mouse_delta = {0, 0};
    float mouse_wheel = 0.0f;
};

// Current framebuffer size. Maintained by InputGatherSystem.
struct WindowInfo {
    int width = 0;
    int height = 0;
};
