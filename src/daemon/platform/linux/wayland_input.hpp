#pragma once

#include "platform/input_injector.hpp"
#include "platform/window_manager.hpp"

#include <optional>
#include <string>
#include <vector>

// Pointer through ydotool, keyboard through wtype, window operations through
// the window manager's command interface.
class WaylandInput : public InputInjector {
public:
    // `windows` may be null; window operations then fail and pointer
    // coordinates are used as layout coordinates unchanged.
    WaylandInput(WindowManager* windows, std::string output_name);

    Result move(coords::Point p) override;
    Result click(coords::Point p, MouseButton button, int count) override;
    Result drag(coords::Point from, coords::Point to, double duration_s) override;
    Result scroll(int amount, std::optional<coords::Point> at) override;

    Result type_text(const std::string& text) override;
    Result press(const std::string& key) override;
    Result hotkey(const std::vector<std::string>& keys) override;

    Result focus_window(const std::string& title) override;
    Result minimize_window(const std::string& title) override;
    Result maximize_window(const std::string& title) override;
    Result close_window(const std::string& title) override;
    Result launch_app(const std::string& app) override;
    Result open_url(const std::string& url) override;

    // Wayland clients cannot query the global pointer position.
    std::optional<coords::Point> pointer_position() override { return std::nullopt; }

    // Frame pixel on `output` to compositor layout coordinates.
    static coords::Point to_layout(coords::Point p, const OutputInfo& output);
    // wtype arguments pressing `keys` together, modifiers held around the rest.
    static std::vector<std::string> chord_args(const std::vector<std::string>& keys);
    // `[title="..."]` criteria matching `title` as a literal substring.
    static std::string title_criteria(const std::string& title);

private:
    Result window_command(const std::string& title, const std::string& command);
    coords::Point layout(coords::Point p);

    WindowManager* windows_;
    std::string output_name_;
    std::optional<OutputInfo> output_;
};
