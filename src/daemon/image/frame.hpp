#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

// One screen capture, tightly packed RGB8, row-major.
struct Frame {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> rgb;

    Frame() = default;
    Frame(int w, int h) : width(w), height(h), rgb(static_cast<size_t>(w) * h * 3, 0) {}

    bool empty() const { return width <= 0 || height <= 0 || rgb.empty(); }
    size_t pixel_count() const { return static_cast<size_t>(width) * height; }

    const uint8_t* pixel(int x, int y) const { return rgb.data() + (static_cast<size_t>(y) * width + x) * 3; }
    uint8_t* pixel(int x, int y) { return rgb.data() + (static_cast<size_t>(y) * width + x) * 3; }

    void fill(uint8_t r, uint8_t g, uint8_t b);
};

// Nearest-neighbour resample.
Frame resize(const Frame& src, int width, int height);

// Downscale so the longer side is at most max_size. Smaller frames are returned as-is.
Frame scale_to_fit(const Frame& src, int max_size);
