#pragma once
#include <string>

// ---------------------------------------------------------------------------
// Demo vocabulary: the application states and the player-facing actions the
// input mapping resolves to.
// ---------------------------------------------------------------------------

enum class GameState { Loading, InGame, GameOver };

enum class GameAction {
    MoveForward,
    MoveBack,
    MoveLeft,
    MoveRight,
    Restart,
    ToggleSbs,
    ToggleDebug,
    Exit,
};

inline const char* to_string(GameState s) {
    switch (s) {
        case GameState::Loading:  return "Loading";
        case GameState::InGame:   return "InGame";
        case GameState::GameOver: return "GameOver";
    }
    return "?";
}

inline bool parse_game_state(const std::string& name, GameState& out) {
    if (name == "Loading")  { out = GameState::Loading;  return true; }
    if (name == "InGame")   { out = GameState::InGame;   return true; }
    if (name == "GameOver") { out = GameState::GameOver; return true; }
    return false;
}

inline bool parse_game_action(const std::string& name, GameAction& out) {
    static const struct { const char* name; GameAction action; } table[] = {
        {"MoveForward", GameAction::MoveForward},
        {"MoveBack",    GameAction::MoveBack},
        {"MoveLeft",    GameAction::MoveLeft},
        {"MoveRight",   GameAction::MoveRight},
        {"Restart",     GameAction::Restart},
        {"ToggleSbs",   GameAction::ToggleSbs},
        {"ToggleDebug", GameAction::ToggleDebug},
        {"Exit",        GameAction::Exit},
    };
    for (const auto& entry : table) {
        if (name == entry.name) { out = entry.action; return true; }
    }
    return false;
}
