#include "platform/linux/wayland_input.hpp"

#include "input/key_names.hpp"
#include "platform/linux/subprocess.hpp"
#include "platform/linux/sway_window_manager.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <format>
#include <print>
#include <string_view>
#include <thread>

namespace {

// ydotool click codes: low nibble is the button, 0x40 down, 0x80 up, 0xC0 both.
constexpr int BUTTON_DOWN = 0x40;
constexpr int BUTTON_UP = 0x80;

int button_index(MouseButton button) {
    switch (button) {
        case MouseButton::Left: return 0x00;
        case MouseButton::Right: return 0x01;
        case MouseButton::Middle: return 0x02;
    }
    return 0x00;
}

std::string hex(int code) {
    return std::format("0x{:02X}", code);
}

std::expected<void, std::string> ydotool_move(coords::Point p) {
    return subprocess::run({"ydotool", "mousemove", "--absolute",
                            "-x", std::to_string(p.x), "-y", std::to_string(p.y)});
}

} // namespace

WaylandInput::WaylandInput(WindowManager* windows, std::string output_name)
    : windows_(windows), output_name_(std::move(output_name)) {}

coords::Point WaylandInput::to_layout(coords::Point p, const OutputInfo& output) {
    double scale = output.scale > 0.0 ? output.scale : 1.0;
    return {
        output.rect.x + static_cast<int>(std::lround(p.x / scale)),
        output.rect.y + static_cast<int>(std::lround(p.y / scale)),
    };
}

coords::Point WaylandInput::layout(coords::Point p) {
    if (!output_ && windows_) {
        output_ = select_output(windows_->list_outputs(), output_name_);
    }
    if (!output_) return p;
    return to_layout(p, *output_);
}

WaylandInput::Result WaylandInput::move(coords::Point p) {
    return ydotool_move(layout(p));
}

WaylandInput::Result WaylandInput::click(coords::Point p, MouseButton button, int count) {
    auto moved = move(p);
    if (!moved) return moved;

    int code = BUTTON_DOWN | BUTTON_UP | button_index(button);
    return subprocess::run({"ydotool", "click", "--repeat", std::to_string(std::max(count, 1)),
                            "--next-delay", "60", hex(code)});
}

WaylandInput::Result WaylandInput::drag(coords::Point from, coords::Point to, double duration_s) {
    auto moved = move(from);
    if (!moved) return moved;

    auto down = subprocess::run({"ydotool", "click", hex(BUTTON_DOWN | button_index(MouseButton::Left))});
    if (!down) return down;

    constexpr int STEPS = 10;
    auto step_delay = std::chrono::duration<double>(std::max(duration_s, 0.0) / STEPS);
    Result result;
    for (int i = 1; i <= STEPS && result; ++i) {
        coords::Point p{
            from.x + (to.x - from.x) * i / STEPS,
            from.y + (to.y - from.y) * i / STEPS,
        };
        std::this_thread::sleep_for(step_delay);
        result = move(p);
    }

    // Release even if a move failed so the button is not left held.
    auto up = subprocess::run({"ydotool", "click", hex(BUTTON_UP | button_index(MouseButton::Left))});
    if (!result) return result;
    return up;
}

WaylandInput::Result WaylandInput::scroll(int amount, std::optional<coords::Point> at) {
    if (at) {
        auto moved = move(*at);
        if (!moved) return moved;
    }
    return subprocess::run({"ydotool", "mousemove", "--wheel", "-x", "0", "-y", std::to_string(amount)});
}

WaylandInput::Result WaylandInput::type_text(const std::string& text) {
    // -d adds a small delay between characters so slow clients keep up
    return subprocess::run({"wtype", "-d", "10", text});
}

WaylandInput::Result WaylandInput::press(const std::string& key) {
    if (!keys::modifier_name(key).empty()) {
        return hotkey({key});
    }
    return subprocess::run({"wtype", "-k", keys::to_keysym(key)});
}

std::vector<std::string> WaylandInput::chord_args(const std::vector<std::string>& keys) {
    std::vector<std::string> mods;
    std::vector<std::string> rest;
    for (const auto& key : keys) {
        auto mod = keys::modifier_name(key);
        if (!mod.empty()) {
            mods.push_back(mod);
        } else {
            rest.push_back(keys::to_keysym(key));
        }
    }

    std::vector<std::string> args = {"wtype"};
    for (const auto& mod : mods) args.insert(args.end(), {"-M", mod});
    for (const auto& key : rest) args.insert(args.end(), {"-k", key});
    for (auto it = mods.rbegin(); it != mods.rend(); ++it) args.insert(args.end(), {"-m", *it});
    return args;
}

WaylandInput::Result WaylandInput::hotkey(const std::vector<std::string>& keys) {
    if (keys.empty()) return std::unexpected("hotkey: no keys");
    return subprocess::run(chord_args(keys));
}

std::string WaylandInput::title_criteria(const std::string& title) {
    // Criteria values are PCRE; quote metacharacters and the surrounding quotes.
    std::string out = "[title=\"";
    for (char c : title) {
        if (std::string_view("\\^$.|?*+()[]{}").find(c) != std::string_view::npos) {
            out += '\\';
            out += c;
        } else if (c == '"') {
            out += "\\\"";
        } else {
            out += c;
        }
    }
    out += "\"]";
    return out;
}

WaylandInput::Result WaylandInput::window_command(const std::string& title, const std::string& command) {
    if (!windows_) return std::unexpected("window operations need a sway session");
    if (title.empty()) return windows_->run_command(command);
    return windows_->run_command(title_criteria(title) + " " + command);
}

WaylandInput::Result WaylandInput::focus_window(const std::string& title) {
    return window_command(title, "focus");
}

WaylandInput::Result WaylandInput::minimize_window(const std::string& title) {
    return window_command(title, "move scratchpad");
}

WaylandInput::Result WaylandInput::maximize_window(const std::string& title) {
    return window_command(title, "fullscreen enable");
}

WaylandInput::Result WaylandInput::close_window(const std::string& title) {
    return window_command(title, "kill");
}

WaylandInput::Result WaylandInput::launch_app(const std::string& app) {
    if (app.find_first_of(";|&$`<>\n") != std::string::npos) {
        return std::unexpected("refusing to launch '" + app + "': shell metacharacters");
    }
    if (windows_) return windows_->run_command("exec " + app);
    return subprocess::spawn_detached({app});
}

WaylandInput::Result WaylandInput::open_url(const std::string& url) {
    std::string target = url;
    if (target.find("://") == std::string::npos) {
        target = "https://" + target;
    }
    return subprocess::spawn_detached({"xdg-open", target});
}
