#pragma once

#include "image/frame.hpp"

#include <cctype>
#include <cstdint>
#include <cstring>
#include <expected>
#include <span>
#include <string>

// Decodes binary PPM (P6, maxval 255), the format grim writes with `-t ppm`.
namespace ppm {

inline std::expected<Frame, std::string> decode(std::span<const uint8_t> data) {
    size_t pos = 0;

    auto skip_space_and_comments = [&]() {
        while (pos < data.size()) {
            if (data[pos] == '#') {
                while (pos < data.size() && data[pos] != '\n') pos++;
            } else if (std::isspace(data[pos])) {
                pos++;
            } else {
                break;
            }
        }
    };

    auto read_int = [&]() -> int {
        skip_space_and_comments();
        int v = 0;
        bool any = false;
        while (pos < data.size() && std::isdigit(data[pos])) {
            v = v * 10 + (data[pos] - '0');
            if (v > 1'000'000) return -1;
            pos++;
            any = true;
        }
        return any ? v : -1;
    };

    if (data.size() < 2 || data[0] != 'P' || data[1] != '6') {
        return std::unexpected("not a binary PPM (P6) image");
    }
    pos = 2;

    int width = read_int();
    int height = read_int();
    int maxval = read_int();
    if (width <= 0 || height <= 0 || maxval <= 0) {
        return std::unexpected("malformed PPM header");
    }
    if (maxval != 255) {
        return std::unexpected("unsupported PPM maxval " + std::to_string(maxval));
    }

    // Exactly one whitespace byte separates the header from the raster.
    if (pos >= data.size() || !std::isspace(data[pos])) {
        return std::unexpected("malformed PPM header");
    }
    pos++;

    Frame frame(width, height);
    if (data.size() - pos < frame.rgb.size()) {
        return std::unexpected("truncated PPM raster");
    }
    std::memcpy(frame.rgb.data(), data.data() + pos, frame.rgb.size());
    return frame;
}

} // namespace ppm
