#include "input_gather.hpp"
#include "../events.hpp"
#include "../input_state.hpp"
#include <raylib.h>

void InputGatherSystem::Update(ecs::World& world) {
    InputRecord* input_ptr = world.try_resource<InputRecord>();
    if (!input_ptr) {
        world.set_resource(InputRecord{});
        input_ptr = world.try_resource<InputRecord>();
    }
    auto& input = *input_ptr;

    // 1. Keyboard
    for (int i = 0; i < kMaxKeys; i++) {
        input.keys_down[i] = IsKeyDown(i);
        input.keys_pressed[i] = IsKeyPressed(i);
        input.keys_released[i] = IsKeyReleased(i);
    }

    // 2. Mouse
    Vector2 pos = GetMousePosition();
    Vector2 delta = GetMouseDelta();
    input.mouse_pos = {pos.x, pos.y};
    input.mouse_delta = {delta.x, delta.y};
    input.mouse_wheel = GetMouseWheelMove();

    // 3. Window
    WindowInfo* window = world.try_resource<WindowInfo>();
    if (!window) {
        world.set_resource(WindowInfo{});
        window = world.try_resource<WindowInfo>();
    }
    const int width = GetScreenWidth();
    const int height = GetScreenHeight();
    if (width != window->width || height != window->height || IsWindowResized()) {
        window->width = width;
        window->height = height;
        send_event(world, WindowResized{width, height});
    }
}
