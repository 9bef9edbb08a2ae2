#include "window_context.hpp"

#include <format>

std::string describe_windows(const WindowInfo& focused, const std::vector<WindowInfo>& windows,
                             size_t limit) {
    std::string out = std::format("Foreground Window: '{}'", focused.empty() ? "None" : focused.title);

    std::vector<const WindowInfo*> visible;
    for (auto& w : windows) {
        if (visible.size() >= limit) break;
        if (w.title.empty() || !w.visible) continue;
        visible.push_back(&w);
    }
    if (visible.empty()) return out;

    out += "\nVisible Windows (top-most first):";
    for (size_t i = 0; i < visible.size(); i++) {
        const auto& w = *visible[i];
        bool active = !focused.empty() && w.focused;
        out += std::format("\n{}. '{}'{}", i + 1, w.title, active ? " (ACTIVE)" : "");
        if (!w.app().empty()) out += std::format(" [{}]", w.app());
        out += std::format(" - Bounds: ({}, {}, {}, {})", w.rect.x, w.rect.y,
                           w.rect.x + w.rect.width, w.rect.y + w.rect.height);
    }
    return out;
}
