#pragma once
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../pipeline.hpp"
#include "../systems/split_screen.hpp"
#include <ecs/ecs.hpp>
#include <string>

// ---------------------------------------------------------------------------
// SplitScreenModule
//
// Spawns the LeftCamera / RightCamera entities at startup and re-lays them
// out on every WindowResized event (Logic phase). Requires InputModule,
// which sends the first WindowResized.
// ---------------------------------------------------------------------------

struct SplitScreenModule {
    static void install(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_startup([](ecs::World& w, float) { SplitScreenSystem::spawn_cameras(w); });
        pipeline.add_logic([](ecs::World& w, float) { SplitScreenSystem::Update(w); });
    }
};

// ---------------------------------------------------------------------------
// SbsModule
//
// Side-by-side stereo on top of split-screen. Creates the SbsRig resource
// and adds SbsSystem after SplitScreenSystem. Installs SplitScreenModule
// itself. Whoever moves the view writes SbsRig, not the cameras.
// ---------------------------------------------------------------------------

struct SbsModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline,
                        float gap, SbsRig::Mode mode = SbsRig::Mode::Sbs) {
        SplitScreenModule::install(world, pipeline);

        SbsRig rig;
        rig.gap = gap;
        rig.mode = mode;
        world.set_resource(rig);
        pipeline.add_logic([](ecs::World& w, float) { SbsSystem::Update(w); });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Camera", "SBS", [&world]() {
                auto* r = world.try_resource<SbsRig>();
                if (!r) return std::string("-");
                return r->mode == SbsRig::Mode::Sbs ? std::string("On") : std::string("Off");
            });
        }
    }
};
