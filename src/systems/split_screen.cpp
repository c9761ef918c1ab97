#include "split_screen.hpp"
#include "../events.hpp"
#include "../input_state.hpp"
#include "../math_util.hpp"

using namespace ecs;
namespace vm = toolbox::math;

void SplitScreenSystem::spawn_cameras(World& world) {
    bool has_left = false, has_right = false;
    world.each<LeftCamera>([&](Entity, LeftCamera&) { has_left = true; });
    world.each<RightCamera>([&](Entity, RightCamera&) { has_right = true; });

    if (!has_left) {
        auto e = world.create();
        CameraView view;
        view.order = 1;
        world.add(e, view);
        world.add(e, LeftCamera{});
    }
    if (!has_right) {
        auto e = world.create();
        CameraView view;
        view.order = 2;
        world.add(e, view);
        world.add(e, RightCamera{});
    }
}

std::pair<Viewport, Viewport> SplitScreenSystem::layout(int width, int height) {
    const int half = width / 2;
    Viewport left{0, 0, half, height};
    Viewport right{half, 0, width - half, height};
    return {left, right};
}

void SplitScreenSystem::apply_layout(World& world, int width, int height) {
    auto [left, right] = layout(width, height);
    world.each<CameraView, LeftCamera>([&](Entity, CameraView& view, LeftCamera&) {
        view.viewport = left;
        view.order = 1;
    });
    world.each<CameraView, RightCamera>([&](Entity, CameraView& view, RightCamera&) {
        view.viewport = right;
        view.order = 2;
    });
}

void SplitScreenSystem::Update(World& world) {
    const auto* resized = world.try_resource<Events<WindowResized>>();
    if (!resized || resized->empty()) return;

    const WindowResized& latest = resized->read().back();
    apply_layout(world, latest.width, latest.height);
}

SbsSystem::Eyes SbsSystem::eye_poses(const SbsRig& rig) {
    Eyes eyes;
    const float half_gap = (rig.mode == SbsRig::Mode::Sbs) ? rig.gap * 0.5f : 0.0f;

    ecs::Vec3 forward = vm::normalize(vm::sub(rig.target, rig.position));
    ecs::Vec3 right = vm::normalize(vm::cross(forward, rig.up));
    ecs::Vec3 offset = vm::scale(right, half_gap);

    eyes.left.position = vm::sub(rig.position, offset);
    eyes.left.target = vm::sub(rig.target, offset);
    eyes.left.up = rig.up;

    eyes.right.position = vm::add(rig.position, offset);
    eyes.right.target = vm::add(rig.target, offset);
    eyes.right.up = rig.up;
    return eyes;
}

void SbsSystem::Update(World& world) {
    const auto* rig = world.try_resource<SbsRig>();
    if (!rig) return;

    const auto* window = world.try_resource<WindowInfo>();
    const int width = window ? window->width : 0;
    const int height = window ? window->height : 0;

    const Eyes eyes = eye_poses(*rig);
    const bool stereo = (rig->mode == SbsRig::Mode::Sbs);
    auto [left_vp, right_vp] = SplitScreenSystem::layout(width, height);

    world.each<CameraView, LeftCamera>([&](Entity, CameraView& view, LeftCamera&) {
        view.position = eyes.left.position;
        view.target = eyes.left.target;
        view.up = eyes.left.up;
        view.viewport = stereo ? left_vp : Viewport{0, 0, width, height};
        view.active = true;
    });
    world.each<CameraView, RightCamera>([&](Entity, CameraView& view, RightCamera&) {
        view.position = eyes.right.position;
        view.target = eyes.right.target;
        view.up = eyes.right.up;
        view.viewport = right_vp;
        view.active = stereo;
    });
}
