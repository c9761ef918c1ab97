#pragma once
#include <string>

// Resolves key names used in the config file ("W", "Space", "Left", "F3")
// to raylib KeyboardKey codes. Letters and digits match in either case;
// named keys are case-sensitive.
struct KeyNames {
    static bool lookup(const std::string& name, int& key);
};
