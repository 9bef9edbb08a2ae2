#include "coordinate_transform.hpp"

#include <algorithm>
#include <cmath>

namespace coords {

Point to_pixels(double norm_x, double norm_y, int screen_w, int screen_h) {
    return {
        static_cast<int>(std::lround(norm_x / NORMALIZED_MAX * screen_w)),
        static_cast<int>(std::lround(norm_y / NORMALIZED_MAX * screen_h)),
    };
}

NormalizedPoint to_normalized(int px, int py, int screen_w, int screen_h) {
    if (screen_w <= 0 || screen_h <= 0) return {};
    return {
        static_cast<double>(px) / screen_w * NORMALIZED_MAX,
        static_cast<double>(py) / screen_h * NORMALIZED_MAX,
    };
}

Point resolve(double norm_x, double norm_y, int screen_w, int screen_h,
              const CalibrationOffset& offset) {
    auto p = to_pixels(norm_x, norm_y, screen_w, screen_h);
    return {p.x + offset.dx, p.y + offset.dy};
}

PixelBox BoundingBox::to_pixels(int screen_w, int screen_h) const {
    auto tl = coords::to_pixels(x1, y1, screen_w, screen_h);
    auto br = coords::to_pixels(x2, y2, screen_w, screen_h);
    return {tl.x, tl.y, br.x, br.y};
}

bool is_normalized_valid(double x, double y) {
    return x >= 0 && x <= NORMALIZED_MAX && y >= 0 && y <= NORMALIZED_MAX;
}

bool is_within_screen(Point p, int screen_w, int screen_h) {
    return p.x >= 0 && p.x < screen_w && p.y >= 0 && p.y < screen_h;
}

Point clamp_to_screen(Point p, int screen_w, int screen_h) {
    return {
        std::clamp(p.x, 0, std::max(screen_w - 1, 0)),
        std::clamp(p.y, 0, std::max(screen_h - 1, 0)),
    };
}

} // namespace coords
