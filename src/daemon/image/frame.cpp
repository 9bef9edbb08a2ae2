#include "image/frame.hpp"

#include <algorithm>
#include <cstring>

void Frame::fill(uint8_t r, uint8_t g, uint8_t b) {
    for (size_t i = 0; i + 2 < rgb.size(); i += 3) {
        rgb[i] = r;
        rgb[i + 1] = g;
        rgb[i + 2] = b;
    }
}

Frame resize(const Frame& src, int width, int height) {
    if (src.empty() || width <= 0 || height <= 0) return {};
    if (src.width == width && src.height == height) return src;

    Frame out(width, height);
    for (int y = 0; y < height; y++) {
        int sy = static_cast<int>(static_cast<int64_t>(y) * src.height / height);
        for (int x = 0; x < width; x++) {
            int sx = static_cast<int>(static_cast<int64_t>(x) * src.width / width);
            std::memcpy(out.pixel(x, y), src.pixel(sx, sy), 3);
        }
    }
    return out;
}

Frame scale_to_fit(const Frame& src, int max_size) {
    int longest = std::max(src.width, src.height);
    if (max_size <= 0 || longest <= max_size) return src;

    double scale = static_cast<double>(max_size) / longest;
    int w = std::max(1, static_cast<int>(src.width * scale));
    int h = std::max(1, static_cast<int>(src.height * scale));
    return resize(src, w, h);
}
