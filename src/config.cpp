#include "config.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>

using json = nlohmann::json;

ViewMode parse_view_mode(const std::string& name) {
    if (name == "single") return ViewMode::Single;
    if (name == "split")  return ViewMode::Split;
    if (name == "sbs")    return ViewMode::Sbs;
    throw ConfigError("Config: unknown view mode '" + name + "'");
}

static AppConfig parse_document(const json& root) {
    AppConfig cfg;

    if (root.contains("window")) {
        const auto& w = root.at("window");
        cfg.window.width  = w.value("width",  cfg.window.width);
        cfg.window.height = w.value("height", cfg.window.height);
        cfg.window.title  = w.value("title",  cfg.window.title);
        if (cfg.window.width <= 0 || cfg.window.height <= 0) {
            throw ConfigError("Config: window size must be positive");
        }
    }

    if (root.contains("view")) {
        const auto& v = root.at("view");
        cfg.view_mode = parse_view_mode(v.value("mode", std::string("single")));
        cfg.sbs_gap   = v.value("sbs_gap", cfg.sbs_gap);
        if (cfg.sbs_gap < 0.0f) throw ConfigError("Config: sbs_gap must not be negative");
    }

    cfg.scene_path = root.value("scene", cfg.scene_path);

    if (root.contains("assets")) {
        for (const auto& [slot, path] : root.at("assets").items()) {
            cfg.assets[slot] = path.get<std::string>();
        }
    }

    if (root.contains("input")) {
        for (const auto& b : root.at("input")) {
            BindingConfig binding;
            binding.trigger = b.at("trigger").get<std::string>();
            binding.key     = b.at("key").get<std::string>();
            binding.action  = b.at("action").get<std::string>();
            parse_trigger(binding.trigger);  // throws on unknown names
            cfg.bindings.push_back(std::move(binding));
        }
    }

    if (root.contains("hazards")) {
        const auto& h = root.at("hazards");
        cfg.hazard_interval = h.value("interval", cfg.hazard_interval);
        cfg.hazard_lifetime = h.value("lifetime", cfg.hazard_lifetime);
        if (cfg.hazard_interval <= 0.0f) throw ConfigError("Config: hazard interval must be positive");
        if (cfg.hazard_lifetime < 0.0f)  throw ConfigError("Config: hazard lifetime must not be negative");
    }

    return cfg;
}

AppConfig ConfigLoader::parse(const std::string& text) {
    try {
        return parse_document(json::parse(text));
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Config: ") + e.what());
    }
}

AppConfig ConfigLoader::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) throw ConfigError("Config: cannot open " + path);
    const std::string content(std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>{});
    return parse(content);
}
