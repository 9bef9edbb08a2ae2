#pragma once

#include "image/frame.hpp"
#include "platform/screen_capture.hpp"

#include <chrono>
#include <functional>
#include <string>

// Blocks until consecutive captures stop changing, so the next frame the
// model sees reflects the previous action.
class StabilityGate {
public:
    struct Options {
        double threshold = 0.02;                      // fraction of changed pixels
        std::chrono::milliseconds max_wait{3000};
        std::chrono::milliseconds check_interval{150};
        std::chrono::milliseconds busy_poll{100};
        int min_stable_frames = 2;
    };

    // Returns true while the platform shows a busy/loading cursor.
    using BusyProbe = std::function<bool()>;

    struct StableResult {
        bool stable = false;
        std::chrono::duration<double> elapsed{0};
    };

    struct ReadyResult {
        bool ready = false;
        std::string reason;
    };

    static constexpr int CHANNEL_TOLERANCE = 10;

    StabilityGate(ScreenCapture& capture, Options options, BusyProbe busy_probe = {});

    // Fraction in [0,1] of pixels where any channel differs by more than the
    // tolerance. `b` is resampled to `a`'s size first if they differ.
    static double difference(const Frame& a, const Frame& b, int tolerance = CHANNEL_TOLERANCE);

    StableResult wait_stable(double threshold, std::chrono::milliseconds max_wait,
                             std::chrono::milliseconds check_interval, int min_stable_frames);
    StableResult wait_stable() {
        return wait_stable(options_.threshold, options_.max_wait, options_.check_interval,
                           options_.min_stable_frames);
    }

    // Busy-cursor wait followed by wait_stable(). A timeout is a normal result.
    ReadyResult ready();

    const Options& options() const { return options_; }

private:
    ScreenCapture& capture_;
    Options options_;
    BusyProbe busy_probe_;
};
