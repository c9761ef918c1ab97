#pragma once
#include "input_mapping.hpp"
#include <map>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// AppConfig — contents of resources/config/toolbox.json.
//
// Every key is optional; missing keys keep the defaults below. Present keys
// with the wrong type or an unknown enum value are reported as ConfigError.
// ---------------------------------------------------------------------------

enum class ViewMode { Single, Split, Sbs };

struct AppConfig {
    struct Window {
        int width = 1280;
        int height = 720;
        std::string title = "ECS Toolbox";
    };

    Window window;
    ViewMode view_mode = ViewMode::Single;
    float sbs_gap = 0.065f;

    std::string scene_path = "resources/scenes/arena.json";
    std::map<std::string, std::string> assets;  // slot name -> path override
    std::vector<BindingConfig> bindings;

    float hazard_interval = 2.0f;   // seconds between falling hazards
    float hazard_lifetime = 6.0f;   // seconds before a hazard despawns
};

class ConfigLoader {
public:
    // Throws ConfigError on malformed JSON or invalid values.
    static AppConfig parse(const std::string& json);

    // Throws ConfigError if the file cannot be read.
    static AppConfig load(const std::string& path);
};

ViewMode parse_view_mode(const std::string& name);
