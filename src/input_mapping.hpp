#pragma once
#include "errors.hpp"
#include "events.hpp"
#include "input_state.hpp"
#include <ecs/ecs.hpp>
#include <algorithm>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Input mapping — raw keys to user-defined actions.
//
// Action is any copyable, equality-comparable type (usually an enum).
// InputMapping<Action> is a World resource; InputMappingSystem<Action> turns
// the current InputRecord into ActionEvent<Action>s every frame.
// ---------------------------------------------------------------------------

struct UserInput {
    enum class Trigger {
        KeyDown,     // key went down this frame
        KeyUp,       // key went up this frame
        KeyPressed,  // key is held
    };

    Trigger trigger;
    int     key;

    static UserInput down(int key)    { return {Trigger::KeyDown, key}; }
    static UserInput up(int key)      { return {Trigger::KeyUp, key}; }
    static UserInput pressed(int key) { return {Trigger::KeyPressed, key}; }

    bool active(const InputRecord& record) const {
        if (key < 0 || key >= kMaxKeys) return false;
        switch (trigger) {
            case Trigger::KeyDown:    return record.keys_pressed[key];
            case Trigger::KeyUp:      return record.keys_released[key];
            case Trigger::KeyPressed: return record.keys_down[key];
        }
        return false;
    }
};

template<typename Action>
struct InputMapping {
    struct Item {
        UserInput input;
        Action    action;
    };

    InputMapping() = default;
    InputMapping(std::initializer_list<std::pair<UserInput, Action>> items) {
        for (const auto& [input, action] : items) bind(input, action);
    }

    void bind(UserInput input, Action action) { items_.push_back({input, std::move(action)}); }

    const std::vector<Item>& items() const { return items_; }
    bool empty() const { return items_.empty(); }

    // Distinct actions whose input condition holds, in order of first match.
    std::vector<Action> resolve(const InputRecord& record) const {
        std::vector<Action> actions;
        for (const auto& item : items_) {
            if (!item.input.active(record)) continue;
            if (std::find(actions.begin(), actions.end(), item.action) != actions.end()) continue;
            actions.push_back(item.action);
        }
        return actions;
    }

private:
    std::vector<Item> items_;
};

template<typename Action>
struct ActionEvent {
    Action action;
};

// ---------------------------------------------------------------------------
// Building mappings from configuration
//
// BindingConfig is the parsed form of one entry in the "input" array of the
// config file. Key and action names are resolved by the caller-supplied
// functions, which return false for unknown names.
// ---------------------------------------------------------------------------

struct BindingConfig {
    std::string trigger;  // "down", "up" or "pressed"
    std::string key;
    std::string action;
};

inline UserInput::Trigger parse_trigger(const std::string& s) {
    if (s == "down")    return UserInput::Trigger::KeyDown;
    if (s == "up")      return UserInput::Trigger::KeyUp;
    if (s == "pressed") return UserInput::Trigger::KeyPressed;
    throw ConfigError("InputMapping: unknown trigger '" + s + "'");
}

// KeyFn:    bool(const std::string& name, int& key)
// ActionFn: bool(const std::string& name, Action& action)
template<typename Action, typename KeyFn, typename ActionFn>
InputMapping<Action> build_input_mapping(const std::vector<BindingConfig>& bindings,
                                         KeyFn resolve_key, ActionFn resolve_action) {
    InputMapping<Action> mapping;
    for (const auto& b : bindings) {
        UserInput input{parse_trigger(b.trigger), 0};
        if (!resolve_key(b.key, input.key)) {
            throw ConfigError("InputMapping: unknown key '" + b.key + "'");
        }
        Action action{};
        if (!resolve_action(b.action, action)) {
            throw ConfigError("InputMapping: unknown action '" + b.action + "'");
        }
        mapping.bind(input, action);
    }
    return mapping;
}

// ---------------------------------------------------------------------------
// InputMappingSystem<Action> — Pre-Update system; runs after InputGather.
// ---------------------------------------------------------------------------

template<typename Action>
class InputMappingSystem {
public:
    static void Update(ecs::World& world) {
        auto* record = world.try_resource<InputRecord>();
        auto* mapping = world.try_resource<InputMapping<Action>>();
        auto* events = world.try_resource<Events<ActionEvent<Action>>>();
        if (!record || !mapping || !events) return;

        for (auto& action : mapping->resolve(*record)) {
            events->send(ActionEvent<Action>{std::move(action)});
        }
    }
};
