#pragma once

#include <string>
#include <string_view>

// Model key names ("enter", "ctrl", "pagedown") to XKB keysym names for wtype.
namespace keys {

std::string to_keysym(std::string_view name);

// wtype modifier name ("ctrl", "shift", "alt", "logo") or empty if `name` is a regular key.
std::string modifier_name(std::string_view name);

} // namespace keys
