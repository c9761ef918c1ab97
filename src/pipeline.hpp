#pragma once
#include <ecs/ecs.hpp>
#include <vector>
#include <functional>

namespace ecs {

/**
 * @brief Manages groups of systems categorized by execution phase.
 *
 * Frame order: startup (once) -> pre-update -> logic -> physics (fixed step,
 * driven by the caller) -> render. Systems within a phase run in the order
 * they were added, which is how modules express their dependencies.
 */
class Pipeline {
public:
    using SystemFunc = std::function<void(World&, float)>;

    void add_startup(SystemFunc func) { startup_.push_back(std::move(func)); }
    void add_pre_update(SystemFunc func) { pre_update_.push_back(std::move(func)); }
    void add_logic(SystemFunc func) { logic_.push_back(std::move(func)); }
    void add_physics(SystemFunc func) { physics_.push_back(std::move(func)); }
    void add_render(SystemFunc func) { render_.push_back(std::move(func)); }

    /**
     * @brief Runs the startup systems. Later calls do nothing.
     */
    void run_startup(World& world) {
        if (started_) return;
        started_ = true;
        for (auto& sys : startup_) sys(world, 0.0f);
        world.deferred().flush(world);
    }

    /**
     * @brief Executes the pre-update and logic phases.
     */
    void update(World& world, float dt) {
        run_startup(world);

        // 1. Events, state transitions, input
        for (auto& sys : pre_update_) sys(world, dt);

        // 2. Gameplay logic
        for (auto& sys : logic_) sys(world, dt);

        // 3. Sync structural changes (spawned hazards, despawns) before physics
        world.deferred().flush(world);
    }

    /**
     * @brief Executes only the physics/simulation systems.
     */
    void step_physics(World& world, float dt) {
        for (auto& sys : physics_) sys(world, dt);
    }

    /**
     * @brief Executes rendering systems.
     */
    void render(World& world) {
        for (auto& sys : render_) sys(world, 0.0f);
    }

    size_t system_count() const {
        return startup_.size() + pre_update_.size() + logic_.size() + physics_.size() + render_.size();
    }

private:
    std::vector<SystemFunc> startup_;
    std::vector<SystemFunc> pre_update_;
    std::vector<SystemFunc> logic_;
    std::vector<SystemFunc> physics_;
    std::vector<SystemFunc> render_;
    bool started_ = false;
};

} // namespace ecs
