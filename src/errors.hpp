#pragma once
#include <stdexcept>
#include <string>

// Raised for invalid caller-supplied configuration: inverted range bounds,
// negative durations, unknown key/action names, malformed config files.
// There is no runtime recovery; callers fix the configuration.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};
