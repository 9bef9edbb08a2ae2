#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

struct QueuedTask {
    uint64_t id = 0;
    std::string text;
};

// Blocking task intake. Any thread may push; only the agent worker pops.
class TaskQueue {
public:
    uint64_t push(std::string text) {
        uint64_t id;
        {
            std::lock_guard lock(mutex_);
            id = next_id_++;
            tasks_.push_back({id, std::move(text)});
        }
        cv_.notify_one();
        return id;
    }

    // Blocks until a task is available or stop is requested.
    std::optional<QueuedTask> pop(std::stop_token stop) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait(lock, stop, [this] { return !tasks_.empty(); })) {
            return std::nullopt;
        }
        auto task = std::move(tasks_.front());
        tasks_.pop_front();
        return task;
    }

    // Drops everything not yet started. Returns how many were dropped.
    size_t clear() {
        std::lock_guard lock(mutex_);
        size_t n = tasks_.size();
        tasks_.clear();
        return n;
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return tasks_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<QueuedTask> tasks_;
    uint64_t next_id_ = 1;
};
