#pragma once

#include "coordinate_transform.hpp"

#include <expected>
#include <optional>
#include <string>
#include <vector>

enum class MouseButton { Left, Right, Middle };

// Synthetic input. All coordinates are frame pixels of the primary output.
class InputInjector {
public:
    using Result = std::expected<void, std::string>;

    virtual ~InputInjector() = default;

    virtual Result move(coords::Point p) = 0;
    virtual Result click(coords::Point p, MouseButton button, int count) = 0;
    virtual Result drag(coords::Point from, coords::Point to, double duration_s) = 0;
    // Positive amount scrolls up, negative down.
    virtual Result scroll(int amount, std::optional<coords::Point> at) = 0;

    virtual Result type_text(const std::string& text) = 0;
    virtual Result press(const std::string& key) = 0;
    virtual Result hotkey(const std::vector<std::string>& keys) = 0;

    virtual Result focus_window(const std::string& title) = 0;
    virtual Result minimize_window(const std::string& title) = 0;
    virtual Result maximize_window(const std::string& title) = 0;
    virtual Result close_window(const std::string& title) = 0;
    virtual Result launch_app(const std::string& app) = 0;
    virtual Result open_url(const std::string& url) = 0;

    // Current pointer position if the backend can read it back.
    virtual std::optional<coords::Point> pointer_position() = 0;
};
