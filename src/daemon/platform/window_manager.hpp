#pragma once

#include "sway/window_info.hpp"

#include <expected>
#include <string>
#include <vector>

class WindowManager {
public:
    virtual ~WindowManager() = default;
    virtual bool connect() = 0;
    virtual bool subscribe_focus_events() = 0;
    virtual WindowInfo get_focused_window() = 0;
    // Focused window first, then the remaining visible windows, then hidden ones.
    virtual std::vector<WindowInfo> list_windows() = 0;
    virtual std::vector<OutputInfo> list_outputs() = 0;
    virtual std::expected<void, std::string> run_command(const std::string& command) = 0;
    virtual int event_fd() const = 0;
    virtual bool read_event(WindowInfo& info) = 0;
};
