#pragma once
#include "assets.hpp"
#include <ecs/ecs.hpp>
#include <ecs/modules/transform.hpp>
#include <cstdint>

// ---------------------------------------------------------------------------
// Engine-free authoring data. Nothing here includes Jolt or raylib, so the
// headless test target can create and inspect every component.
// ---------------------------------------------------------------------------

struct Color4 {
    float r, g, b, a;
};

namespace Colors {
    inline constexpr Color4 White  = {1.0f,  1.0f,  1.0f,  1.0f};
    inline constexpr Color4 Maroon = {0.75f, 0.13f, 0.22f, 1.0f};
    inline constexpr Color4 Gold   = {1.0f,  0.8f,  0.0f,  1.0f};
    inline constexpr Color4 Sky    = {0.4f,  0.75f, 1.0f,  1.0f};
}

enum class ShapeType { Box, Sphere, Capsule };

// ---------------------------------------------------------------------------
// Physics Configuration (Authoring)
// ---------------------------------------------------------------------------

enum class BodyType { Static, Kinematic, Dynamic };

struct BoxCollider {
    ecs::Vec3 half_extents = {0.5f, 0.5f, 0.5f};
};

struct SphereCollider {
    float radius = 0.5f;
};

// If present, the PhysicsSystem will try to create a Jolt Body for this entity
struct RigidBodyConfig {
    BodyType type = BodyType::Dynamic;
    float mass = 1.0f;
    float friction = 0.5f;
    float restitution = 0.0f;
    bool sensor = false;
};

// Desired horizontal velocity (x, z) in m/s. PhysicsSystem applies it to the
// body before each step; vertical velocity is left to the simulation.
struct MoveIntent {
    ecs::Vec2 velocity = {0, 0};
};

// ---------------------------------------------------------------------------
// Visuals
// ---------------------------------------------------------------------------

struct MeshRenderer {
    ShapeType shape_type = ShapeType::Box;
    Color4 color = Colors::White;
    ecs::Vec3 scale_offset = {1, 1, 1}; // Visual scale multiplier
};

// Camera-facing textured quad drawn at the entity's WorldTransform.
struct Sprite {
    AssetHandle texture = kInvalidAsset;
    float size = 1.0f;
    Color4 tint = Colors::White;
};

// ---------------------------------------------------------------------------
// Despawn
// ---------------------------------------------------------------------------

// Removes its entity once expired. Build with after_seconds() / after_frames();
// DespawnSystem advances it.
struct AutoDespawn {
    enum class Mode  { Timer, Frames };
    enum class State { Alive, Expired };

    Mode mode = Mode::Timer;
    State state = State::Alive;
    float duration = 0.0f;  // Timer: seconds until expiry
    float elapsed = 0.0f;   // Timer: accumulated frame time
    uint32_t frames = 0;    // Frames: ticks left before the expiring tick

    static AutoDespawn after_seconds(float seconds);
    static AutoDespawn after_frames(uint32_t frames);

    float remaining_time() const { return duration - elapsed; }
};

// ---------------------------------------------------------------------------
// Cameras
// ---------------------------------------------------------------------------

// Pixel rectangle of the window, origin top-left.
struct Viewport {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
};

struct CameraView {
    ecs::Vec3 position = {0, 10, 20};
    ecs::Vec3 target = {0, 0, 0};
    ecs::Vec3 up = {0, 1, 0};
    float fovy = 45.0f;
    Viewport viewport;
    int order = 0;        // lower orders are drawn first
    bool active = true;
};

// Exactly one of each is expected when split-screen is installed.
struct LeftCamera {};
struct RightCamera {};

// Stereo rig: a single pose that drives LeftCamera and RightCamera.
struct SbsRig {
    enum class Mode { Sbs, Deactivated };

    ecs::Vec3 position = {0, 10, 20};
    ecs::Vec3 target = {0, 0, 0};
    ecs::Vec3 up = {0, 1, 0};
    float gap = 0.065f;   // distance between the eyes, world units
    Mode mode = Mode::Sbs;
};

// ---------------------------------------------------------------------------
// Gameplay
// ---------------------------------------------------------------------------

struct Hazard {
    float damage = 10.0f;
};

struct Pickup {
    float heal = 25.0f;
};

struct PlayerTag {};
struct WorldTag {};
