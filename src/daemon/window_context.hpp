#pragma once

#include "sway/window_info.hpp"

#include <cstddef>
#include <string>
#include <vector>

// Prompt text describing the foreground window and the windows stacked
// behind it, e.g.
//   Foreground Window: 'Inbox - Mozilla Thunderbird'
//   Visible Windows (top-most first):
//   1. 'Inbox - Mozilla Thunderbird' (ACTIVE) - Bounds: (0, 0, 1920, 1080)
std::string describe_windows(const WindowInfo& focused, const std::vector<WindowInfo>& windows,
                             size_t limit = 5);
