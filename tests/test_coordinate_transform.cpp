#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "coordinate_transform.hpp"

#include <algorithm>
#include <cmath>

using namespace coords;
using Catch::Matchers::WithinAbs;

TEST_CASE("Coordinate conversion", "[coords]") {

    SECTION("CenterOfFullHd") {
        REQUIRE(to_pixels(500, 500, 1920, 1080) == Point{960, 540});
    }

    SECTION("Corners") {
        REQUIRE(to_pixels(0, 0, 1920, 1080) == Point{0, 0});
        REQUIRE(to_pixels(1000, 1000, 1920, 1080) == Point{1920, 1080});
    }

    SECTION("RoundsToNearest") {
        // 333 / 1000 * 1366 = 454.878
        REQUIRE(to_pixels(333, 0, 1366, 768).x == 455);
        // 1 / 1000 * 1080 = 1.08
        REQUIRE(to_pixels(0, 1, 1920, 1080).y == 1);
    }

    SECTION("ToNormalizedInverts") {
        auto n = to_normalized(960, 540, 1920, 1080);
        REQUIRE_THAT(n.x, WithinAbs(500.0, 1e-9));
        REQUIRE_THAT(n.y, WithinAbs(500.0, 1e-9));
    }

    SECTION("RoundTripWithinOneUnit") {
        struct Screen { int w, h; };
        for (auto [w, h] : {Screen{1920, 1080}, Screen{2560, 1440}, Screen{1366, 768}}) {
            double worst = 0.0;
            for (int nx = 0; nx <= 1000; nx++) {
                for (int ny = 0; ny <= 1000; ny++) {
                    auto p = to_pixels(nx, ny, w, h);
                    auto n = to_normalized(p.x, p.y, w, h);
                    worst = std::max({worst, std::abs(n.x - nx), std::abs(n.y - ny)});
                }
            }
            INFO(w << "x" << h);
            REQUIRE(worst <= 1.0);
        }
    }

    SECTION("ToNormalizedZeroScreen") {
        auto n = to_normalized(10, 10, 0, 0);
        REQUIRE(n.x == 0.0);
        REQUIRE(n.y == 0.0);
    }

    SECTION("ResolveAppliesOffset") {
        REQUIRE(resolve(500, 500, 1920, 1080, {5, -3}) == Point{965, 537});
        REQUIRE(resolve(500, 500, 1920, 1080, {}) == Point{960, 540});
    }

    SECTION("BoundingBox") {
        BoundingBox box{100, 200, 300, 400};
        REQUIRE(box.center() == Point{200, 300});
        REQUIRE(box.width() == 200);
        REQUIRE(box.height() == 200);

        auto px = box.to_pixels(1000, 500);
        REQUIRE(px.x1 == 100);
        REQUIRE(px.y1 == 100);
        REQUIRE(px.x2 == 300);
        REQUIRE(px.y2 == 200);
        REQUIRE(px.center() == Point{200, 150});
    }
}

TEST_CASE("Coordinate validation", "[coords]") {

    SECTION("NormalizedRange") {
        REQUIRE(is_normalized_valid(0, 0));
        REQUIRE(is_normalized_valid(1000, 1000));
        REQUIRE_FALSE(is_normalized_valid(-1, 500));
        REQUIRE_FALSE(is_normalized_valid(500, 1000.5));
    }

    SECTION("WithinScreenIsHalfOpen") {
        REQUIRE(is_within_screen({0, 0}, 1920, 1080));
        REQUIRE(is_within_screen({1919, 1079}, 1920, 1080));
        REQUIRE_FALSE(is_within_screen({1920, 500}, 1920, 1080));
        REQUIRE_FALSE(is_within_screen({500, -1}, 1920, 1080));
    }

    SECTION("Clamp") {
        REQUIRE(clamp_to_screen({1920, 1080}, 1920, 1080) == Point{1919, 1079});
        REQUIRE(clamp_to_screen({-40, 20}, 1920, 1080) == Point{0, 20});
        REQUIRE(clamp_to_screen({700, 300}, 1920, 1080) == Point{700, 300});
    }

    SECTION("ClampDegenerateScreen") {
        REQUIRE(clamp_to_screen({50, 50}, 0, 0) == Point{0, 0});
    }
}
