#pragma once
#include "../events.hpp"
#include "../input_mapping.hpp"
#include "../input_state.hpp"
#include "../pipeline.hpp"
#include "../systems/input_gather.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// InputModule
//
// Adds InputGatherSystem to the Pre-Update phase (after the EventBus flush)
// and creates the InputRecord / WindowInfo resources it fills.
// ---------------------------------------------------------------------------

struct InputModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.set_resource(InputRecord{});
        world.set_resource(WindowInfo{});
        pipeline.add_pre_update([](ecs::World& w, float) { InputGatherSystem::Update(w); });
    }
};

// ---------------------------------------------------------------------------
// InputMappingModule<Action>
//
// Stores the mapping as a resource, registers ActionEvent<Action>, and adds
// InputMappingSystem<Action> to Pre-Update. Install after InputModule.
// Several action types may be installed side by side.
// ---------------------------------------------------------------------------

template<typename Action>
struct InputMappingModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline, InputMapping<Action> mapping) {
        world.set_resource(std::move(mapping));
        world.resource<EventRegistry>().register_queue<ActionEvent<Action>>(world);
        pipeline.add_pre_update([](ecs::World& w, float) { InputMappingSystem<Action>::Update(w); });
    }
};
