#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

// Lock-free single-producer single-consumer queue of steering strings.
// Producer (event loop thread) calls push(). Consumer (agent thread) calls drain().
class SteeringQueue {
public:
    explicit SteeringQueue(size_t capacity = 32)
        : slots_(capacity), capacity_(capacity) {}

    // Producer: returns false when the queue is full.
    bool push(std::string text) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        if (w - r >= capacity_) return false;

        slots_[w % capacity_] = std::move(text);
        write_pos_.store(w + 1, std::memory_order_release);
        return true;
    }

    // Consumer: take everything queued so far, oldest first.
    std::vector<std::string> drain() {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);

        std::vector<std::string> out;
        out.reserve(w - r);
        for (; r < w; r++) {
            out.push_back(std::move(slots_[r % capacity_]));
        }

        read_pos_.store(r, std::memory_order_release);
        return out;
    }

    size_t size() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return w - r;
    }

    bool empty() const { return size() == 0; }
    size_t capacity() const { return capacity_; }

private:
    std::vector<std::string> slots_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
};
