#pragma once
#include "../components.hpp"
#include <ecs/ecs.hpp>
#include <utility>

// ---------------------------------------------------------------------------
// SplitScreenSystem
//
// Owns one LeftCamera and one RightCamera entity, each with a CameraView.
// On every WindowResized event the views are laid out side by side: left
// half at order 1, right half at order 2. Odd widths give the extra pixel
// to the right view.
// ---------------------------------------------------------------------------

class SplitScreenSystem {
public:
    // Creates the two camera entities unless they already exist.
    static void spawn_cameras(ecs::World& world);

    // Logic phase. Applies the latest WindowResized event, if any.
    static void Update(ecs::World& world);

    // {left, right} viewports for a width x height window. Pure.
    static std::pair<Viewport, Viewport> layout(int width, int height);

    // Writes layout(width, height) into the two cameras.
    static void apply_layout(ecs::World& world, int width, int height);
};

// ---------------------------------------------------------------------------
// SbsSystem
//
// Drives the split cameras from the single SbsRig resource. In Sbs mode each
// eye is the rig pose moved gap/2 along the rig's right vector (left eye to
// the negative side), with parallel view directions. In Deactivated mode the
// left camera renders the centred pose on the whole window and the right
// camera is switched off. Runs after SplitScreenSystem.
// ---------------------------------------------------------------------------

class SbsSystem {
public:
    struct Eyes {
        CameraView left;
        CameraView right;
    };

    static void Update(ecs::World& world);

    // Eye poses (position, target, up) for the rig. Viewports are untouched.
    static Eyes eye_poses(const SbsRig& rig);

    static void toggle(SbsRig& rig) {
        rig.mode = (rig.mode == SbsRig::Mode::Sbs) ? SbsRig::Mode::Deactivated : SbsRig::Mode::Sbs;
    }
};
