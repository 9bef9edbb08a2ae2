#include "stability_gate.hpp"

#include <algorithm>
#include <cstdlib>
#include <format>
#include <optional>
#include <print>
#include <thread>

using Clock = std::chrono::steady_clock;

StabilityGate::StabilityGate(ScreenCapture& capture, Options options, BusyProbe busy_probe)
    : capture_(capture), options_(options), busy_probe_(std::move(busy_probe)) {}

double StabilityGate::difference(const Frame& a, const Frame& b, int tolerance) {
    if (a.empty() || b.empty()) return 1.0;

    Frame resized;
    const Frame* other = &b;
    if (a.width != b.width || a.height != b.height) {
        resized = resize(b, a.width, a.height);
        other = &resized;
    }

    size_t changed = 0;
    const uint8_t* pa = a.rgb.data();
    const uint8_t* pb = other->rgb.data();
    const size_t pixels = a.pixel_count();
    for (size_t i = 0; i < pixels; i++, pa += 3, pb += 3) {
        if (std::abs(pa[0] - pb[0]) > tolerance
            || std::abs(pa[1] - pb[1]) > tolerance
            || std::abs(pa[2] - pb[2]) > tolerance) {
            changed++;
        }
    }
    return static_cast<double>(changed) / static_cast<double>(pixels);
}

StabilityGate::StableResult StabilityGate::wait_stable(double threshold, std::chrono::milliseconds max_wait,
                                                       std::chrono::milliseconds check_interval,
                                                       int min_stable_frames) {
    const auto start = Clock::now();
    const auto deadline = start + max_wait;
    const int needed = std::max(min_stable_frames, 1);

    std::optional<Frame> previous;
    int stable_count = 0;

    while (Clock::now() < deadline) {
        auto frame = capture_.capture();
        if (!frame) {
            std::println(stderr, "stability: capture failed: {}", frame.error());
            previous.reset();
            stable_count = 0;
        } else {
            if (previous) {
                double diff = difference(*previous, *frame);
                if (diff <= threshold) {
                    if (++stable_count >= needed) {
                        return {true, Clock::now() - start};
                    }
                } else {
                    stable_count = 0;
                }
            }
            previous = std::move(*frame);
        }

        auto remaining = deadline - Clock::now();
        if (remaining <= Clock::duration::zero()) break;
        std::this_thread::sleep_for(std::min<Clock::duration>(check_interval, remaining));
    }

    return {false, Clock::now() - start};
}

StabilityGate::ReadyResult StabilityGate::ready() {
    if (busy_probe_ && busy_probe_()) {
        const auto deadline = Clock::now() + options_.max_wait;
        bool busy = true;
        while (Clock::now() < deadline) {
            std::this_thread::sleep_for(options_.busy_poll);
            if (!busy_probe_()) {
                busy = false;
                break;
            }
        }
        if (busy) return {false, "Loading cursor timeout"};
    }

    auto result = wait_stable();
    if (result.stable) {
        return {true, std::format("Ready after {:.2f}s", result.elapsed.count())};
    }
    return {false, "Screen did not stabilize"};
}
