#pragma once

#include "action_executor.hpp"
#include "coordinate_transform.hpp"
#include "event_sink.hpp"
#include "inference/inference_client.hpp"
#include "platform/screen_capture.hpp"
#include "platform/window_manager.hpp"
#include "stability_gate.hpp"
#include "steering_queue.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <thread>

struct TaskResult {
    bool success = false;
    std::string message;
    int steps_taken = 0;
    double duration_seconds = 0.0;
    std::optional<std::string> error;
};

// Capture -> plan -> act -> settle, one task at a time. run_task() blocks the
// calling thread; the interrupt methods may be called from any thread and take
// effect at the next iteration boundary.
class AgentLoop {
public:
    struct Options {
        int max_iterations = 10;
        int max_tokens = 1024;
        size_t history_lines = 5;
        size_t window_context_limit = 5;
        int max_image_size = 1080;
        coords::CalibrationOffset offset;
        bool stability_enabled = true;
        std::chrono::milliseconds settle{1500};      // used when stability is disabled
        std::chrono::milliseconds pause_poll{100};
        std::chrono::milliseconds idle_delay{3000};
    };

    AgentLoop(ScreenCapture& capture, InferenceClient& inference, ActionExecutor& executor,
              StabilityGate& stability, WindowManager* windows, EventSink& events, Options options);
    ~AgentLoop();

    AgentLoop(const AgentLoop&) = delete;
    AgentLoop& operator=(const AgentLoop&) = delete;

    TaskResult run_task(const std::string& task);

    void abort();
    void pause();
    void resume();
    void skip_step();
    // Returns false if the steering queue is full.
    bool inject_context(std::string text);

    // Clears abort/pause/skip and drops unread steering text. run_task() does
    // this on exit; callers that finish a task without it must too.
    void reset_interrupts();

    bool abort_requested() const { return abort_.load(std::memory_order_acquire); }
    bool paused() const { return paused_.load(std::memory_order_acquire); }
    bool running() const { return running_.load(std::memory_order_acquire); }

    // "<observation>" and "<reasoning>" sections condensed for display.
    static std::string extract_thought(const std::string& raw_text);

private:
    std::string build_context(int width, int height, int step);
    TaskResult finish(TaskResult result, AgentStatus status, const std::string& detail,
                      const std::string& thought);
    bool wait_while_paused();
    void schedule_idle();
    void cancel_idle();

    ScreenCapture& capture_;
    InferenceClient& inference_;
    ActionExecutor& executor_;
    StabilityGate& stability_;
    WindowManager* windows_;
    EventSink& events_;
    Options options_;

    std::atomic<bool> abort_{false};
    std::atomic<bool> paused_{false};
    std::atomic<bool> skip_{false};
    std::atomic<bool> running_{false};
    SteeringQueue steering_;

    // Agent thread only.
    std::optional<std::string> last_error_;

    std::jthread idle_timer_;
};
