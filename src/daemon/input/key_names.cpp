#include "input/key_names.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace keys {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

constexpr std::array<std::pair<std::string_view, std::string_view>, 32> KEYSYMS = {{
    {"enter", "Return"},
    {"return", "Return"},
    {"esc", "Escape"},
    {"escape", "Escape"},
    {"tab", "Tab"},
    {"space", "space"},
    {"backspace", "BackSpace"},
    {"delete", "Delete"},
    {"del", "Delete"},
    {"insert", "Insert"},
    {"home", "Home"},
    {"end", "End"},
    {"pageup", "Prior"},
    {"pgup", "Prior"},
    {"pagedown", "Next"},
    {"pgdn", "Next"},
    {"up", "Up"},
    {"down", "Down"},
    {"left", "Left"},
    {"right", "Right"},
    {"capslock", "Caps_Lock"},
    {"printscreen", "Print"},
    {"prtsc", "Print"},
    {"menu", "Menu"},
    {"plus", "plus"},
    {"minus", "minus"},
    {"comma", "comma"},
    {"period", "period"},
    {"slash", "slash"},
    {"backslash", "backslash"},
    {"semicolon", "semicolon"},
    {"apostrophe", "apostrophe"},
}};

constexpr std::array<std::pair<std::string_view, std::string_view>, 10> MODIFIERS = {{
    {"ctrl", "ctrl"},
    {"control", "ctrl"},
    {"shift", "shift"},
    {"alt", "alt"},
    {"option", "alt"},
    {"altgr", "altgr"},
    {"win", "logo"},
    {"super", "logo"},
    {"meta", "logo"},
    {"cmd", "logo"},
}};

} // namespace

std::string to_keysym(std::string_view name) {
    auto key = lower(name);
    for (auto& [from, to] : KEYSYMS) {
        if (key == from) return std::string(to);
    }

    // f1..f24
    if (key.size() >= 2 && key.size() <= 3 && key[0] == 'f'
        && std::all_of(key.begin() + 1, key.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return "F" + key.substr(1);
    }

    // Single characters and names xkb already knows pass through unchanged.
    return std::string(name);
}

std::string modifier_name(std::string_view name) {
    auto key = lower(name);
    for (auto& [from, to] : MODIFIERS) {
        if (key == from) return std::string(to);
    }
    return {};
}

} // namespace keys
