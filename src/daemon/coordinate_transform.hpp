#pragma once

// Conversion between the model's normalized [0,1000] grid and primary-output pixels.
// Output offsets and HiDPI scaling are handled by the capture/input layers, so
// everything here is plain frame-pixel space.

namespace coords {

inline constexpr int NORMALIZED_MAX = 1000;

struct Point {
    int x = 0;
    int y = 0;

    bool operator==(const Point&) const = default;
};

struct NormalizedPoint {
    double x = 0.0;
    double y = 0.0;
};

struct CalibrationOffset {
    int dx = 0;
    int dy = 0;
};

struct PixelBox {
    int x1 = 0, y1 = 0, x2 = 0, y2 = 0;

    Point center() const { return {(x1 + x2) / 2, (y1 + y2) / 2}; }
    int width() const { return x2 - x1; }
    int height() const { return y2 - y1; }
};

// A model-reported region, corners in normalized units.
struct BoundingBox {
    int x1 = 0, y1 = 0, x2 = 0, y2 = 0;

    Point center() const { return {(x1 + x2) / 2, (y1 + y2) / 2}; }
    int width() const { return x2 - x1; }
    int height() const { return y2 - y1; }
    PixelBox to_pixels(int screen_w, int screen_h) const;
};

// px = round(norm / 1000 * screen). Inputs are not validated.
Point to_pixels(double norm_x, double norm_y, int screen_w, int screen_h);

NormalizedPoint to_normalized(int px, int py, int screen_w, int screen_h);

// to_pixels followed by the calibration offset.
Point resolve(double norm_x, double norm_y, int screen_w, int screen_h,
              const CalibrationOffset& offset);

bool is_normalized_valid(double x, double y);
bool is_within_screen(Point p, int screen_w, int screen_h);

// Nearest point inside [0, w) x [0, h).
Point clamp_to_screen(Point p, int screen_w, int screen_h);

} // namespace coords
