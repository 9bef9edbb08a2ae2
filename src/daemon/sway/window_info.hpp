#pragma once

#include <string>

struct WindowRect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
};

struct WindowInfo {
    std::string app_id;        // Wayland app_id (e.g. "firefox")
    std::string window_class;  // X11 class for Xwayland clients
    std::string title;         // window title
    int pid = 0;               // window process PID
    std::string workspace;     // workspace name the window lives on
    WindowRect rect;           // layout coordinates
    bool focused = false;
    bool visible = false;
    bool floating = false;

    bool empty() const { return app_id.empty() && window_class.empty() && title.empty() && pid == 0; }

    // app_id for native clients, class for Xwayland ones.
    const std::string& app() const { return app_id.empty() ? window_class : app_id; }
};

struct OutputInfo {
    std::string name;          // e.g. "DP-1"
    WindowRect rect;           // layout coordinates (logical pixels)
    double scale = 1.0;
    bool active = false;
    bool focused = false;
};
