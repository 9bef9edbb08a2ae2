#pragma once

#include "image/frame.hpp"

#include <expected>
#include <string>

// Grabs the primary output. Frames are always in that output's pixel grid.
class ScreenCapture {
public:
    virtual ~ScreenCapture() = default;
    virtual std::expected<Frame, std::string> capture() = 0;
};
