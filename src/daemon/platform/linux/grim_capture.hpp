#pragma once

#include "platform/screen_capture.hpp"
#include "platform/window_manager.hpp"

#include <optional>
#include <string>

// Screenshots through `grim -t ppm -`, restricted to one output.
class GrimCapture : public ScreenCapture {
public:
    // `windows` may be null, in which case grim captures every output.
    GrimCapture(WindowManager* windows, std::string output_name);

    std::expected<Frame, std::string> capture() override;

private:
    std::optional<std::string> resolve_output();

    WindowManager* windows_;
    std::string output_name_;
    std::optional<std::string> resolved_;
};
