#pragma once
#include "../debug_panel.hpp"
#include "../events.hpp"
#include "../pipeline.hpp"
#include "../systems/debug.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// DebugModule
//
// Creates the DebugPanel world resource, registers Engine-level debug rows
// (FPS, Frame Time, Entity count, Event queues), and adds DebugSystem to the
// Render phase.
//
// Install after EventBusModule and BEFORE any module that adds its own rows,
// so that the DebugPanel resource exists when those modules call
// world.try_resource<DebugPanel>()->watch(...). Install after RenderModule
// so the overlay is drawn on top of the camera views.
// ---------------------------------------------------------------------------

struct DebugModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        DebugPanel panel;

        panel.watch("Engine", "FPS", []() {
            return std::to_string(GetFPS());
        });
        panel.watch("Engine", "Frame Time", []() {
            char b[16];
            std::snprintf(b, sizeof(b), "%d ms", (int)(GetFrameTime() * 1000));
            return std::string(b);
        });
        panel.watch("Engine", "Entities", [&world]() {
            return std::to_string(world.count());
        });
        panel.watch("Engine", "Event Queues", [&world]() {
            auto* reg = world.try_resource<EventRegistry>();
            return reg ? std::to_string(reg->queue_count()) : std::string("-");
        });

        world.set_resource(std::move(panel));
        pipeline.add_render([](ecs::World& w, float) { DebugSystem::Update(w); });
    }
};
