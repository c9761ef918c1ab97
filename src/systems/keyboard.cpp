#include "keyboard.hpp"
#include <raylib.h>
#include <unordered_map>

bool KeyNames::lookup(const std::string& name, int& key) {
    static const std::unordered_map<std::string, int> table = {
        {"Space", KEY_SPACE}, {"Enter", KEY_ENTER}, {"Escape", KEY_ESCAPE},
        {"Tab", KEY_TAB}, {"Backspace", KEY_BACKSPACE},
        {"Left", KEY_LEFT}, {"Right", KEY_RIGHT}, {"Up", KEY_UP}, {"Down", KEY_DOWN},
        {"LeftShift", KEY_LEFT_SHIFT}, {"LeftControl", KEY_LEFT_CONTROL},
        {"F1", KEY_F1}, {"F2", KEY_F2}, {"F3", KEY_F3}, {"F4", KEY_F4},
        {"F5", KEY_F5}, {"F6", KEY_F6},
    };

    // Single letters and digits map straight onto their ASCII codes.
    if (name.size() == 1) {
        char c = name[0];
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
        if ((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
            key = static_cast<int>(c);
            return true;
        }
    }

    auto it = table.find(name);
    if (it == table.end()) return false;
    key = it->second;
    return true;
}
