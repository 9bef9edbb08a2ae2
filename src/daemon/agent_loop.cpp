#include "agent_loop.hpp"

#include "base64.hpp"
#include "image/bmp_encoder.hpp"
#include "prompts.hpp"
#include "window_context.hpp"

#include <condition_variable>
#include <format>
#include <mutex>
#include <print>

using Clock = std::chrono::steady_clock;

namespace {

std::string tag_section(const std::string& text, const char* tag) {
    std::string open = std::format("<{}>", tag);
    std::string close = std::format("</{}>", tag);

    auto begin = text.find(open);
    if (begin == std::string::npos) return {};
    begin += open.size();
    auto finish = text.find(close, begin);
    if (finish == std::string::npos) return {};

    auto start = text.find_first_not_of(" \t\n\r", begin);
    if (start == std::string::npos || start >= finish) return {};
    auto end = text.find_last_not_of(" \t\n\r", finish - 1);
    return text.substr(start, end - start + 1);
}

std::string truncated(const std::string& s, size_t n) {
    return s.size() > n ? s.substr(0, n) + "..." : s;
}

} // namespace

AgentLoop::AgentLoop(ScreenCapture& capture, InferenceClient& inference, ActionExecutor& executor,
                     StabilityGate& stability, WindowManager* windows, EventSink& events, Options options)
    : capture_(capture), inference_(inference), executor_(executor),
      stability_(stability), windows_(windows), events_(events),
      options_(options) {
    inference_.set_abort_check([this] { return abort_requested(); });
}

AgentLoop::~AgentLoop() {
    cancel_idle();
}

TaskResult AgentLoop::run_task(const std::string& task) {
    // Interrupts raised before the task started (pause, steering) still apply.
    cancel_idle();
    running_.store(true, std::memory_order_release);

    executor_.history().clear();
    last_error_.reset();

    std::println(stderr, "agent: starting task: {}", task);
    events_.on_status(AgentStatus::Running, "Task: " + task);

    const auto start = Clock::now();
    auto elapsed = [&start] { return std::chrono::duration<double>(Clock::now() - start).count(); };
    auto aborted = [&](int steps, const std::string& why) {
        return finish({false, "Aborted", steps, elapsed(), why}, AgentStatus::Aborted, "Task aborted", "Aborted.");
    };

    for (int i = 0; i < options_.max_iterations; i++) {
        if (abort_requested()) return aborted(i, "Aborted");

        if (paused() && !wait_while_paused()) return aborted(i, "Aborted");

        if (skip_.exchange(false, std::memory_order_acq_rel)) {
            std::println(stderr, "agent: skipping step {}", i + 1);
            continue;
        }

        const int step = i + 1;

        auto frame = capture_.capture();
        if (!frame) {
            std::println(stderr, "agent: capture failed: {}", frame.error());
            last_error_ = "Screen capture failed: " + frame.error();
            continue;
        }
        executor_.set_screen_size(frame->width, frame->height);

        auto view = scale_to_fit(*frame, options_.max_image_size);
        auto image_b64 = base64::encode(bmp::encode(view));
        events_.on_frame(view.width, view.height, image_b64);

        auto context = build_context(view.width, view.height, step);
        auto prompt = prompts::plan_action(task, context, executor_.history().trace(options_.history_lines));

        auto response = inference_.send_request(prompt, image_b64, options_.max_tokens);
        if (!response.success) {
            if (response.error_kind == InferenceErrorKind::Aborted || abort_requested()) {
                return aborted(i, "Aborted");
            }
            std::println(stderr, "agent: model request failed: {}", response.error.value_or("unknown error"));
            last_error_ = response.error.value_or("Model request failed");
            continue;
        }

        auto thought = extract_thought(response.raw_text);
        if (!thought.empty()) events_.on_thought(thought);

        if (!response.parsed) {
            std::println(stderr, "agent: no JSON in model response: {}", truncated(response.raw_text, 500));
            last_error_ = "Model did not return valid JSON for an action.";
            continue;
        }

        const auto& plan = *response.parsed;
        if (plan.contains("task_complete") && plan["task_complete"].is_boolean()
            && plan["task_complete"].get<bool>()) {
            std::println(stderr, "agent: task complete after {} steps", step);
            return finish({true, "Complete", step, elapsed(), std::nullopt},
                          AgentStatus::Done, "Task complete", "Done.");
        }

        auto decoded = decode_action(plan);
        if (!decoded) {
            std::println(stderr, "agent: {}", decoded.error());
            last_error_ = decoded.error();
            continue;
        }

        auto intent = resolve_coordinates(std::move(*decoded), frame->width, frame->height, options_.offset);
        events_.on_action(intent.kind, intent.target);

        // Same kind on the same target as last time: let it run, but make the
        // next prompt tell the model to change strategy.
        int repeats = 0;
        ActionRecord probe{.kind = intent.kind, .target = intent.target};
        if (auto* last = executor_.history().last(); last && last->same_action(probe)) {
            repeats = 1 + executor_.history().trailing_repeats(probe);
            std::println(stderr, "agent: '{}' on '{}' repeated {} times, forcing strategy change",
                         to_string(intent.kind), intent.target, repeats);
        }

        auto result = executor_.execute(intent);
        if (!result) {
            if (result.error().kind == ActionError::Kind::Failsafe) {
                return aborted(i, result.error().message);
            }
            std::println(stderr, "agent: action failed: {}", result.error().message);
            last_error_ = result.error().message;
        } else {
            last_error_.reset();
        }

        if (repeats > 0) {
            auto target = intent.target.empty() ? std::string("unknown") : intent.target;
            last_error_ = prompts::recovery(std::format("{} on {}", to_string(intent.kind), target), repeats);
        }

        if (options_.stability_enabled) {
            auto ready = stability_.ready();
            if (!ready.ready) {
                std::println(stderr, "agent: screen stability: {}", ready.reason);
            }
        } else {
            std::this_thread::sleep_for(options_.settle);
        }
    }

    std::println(stderr, "agent: max steps reached");
    return finish({false, "Max steps reached", options_.max_iterations, elapsed(), "Max steps reached"},
                  AgentStatus::Error, "Max steps reached", "Stopped: max steps reached.");
}

void AgentLoop::abort() {
    abort_.store(true, std::memory_order_release);
}

void AgentLoop::pause() {
    paused_.store(true, std::memory_order_release);
}

void AgentLoop::resume() {
    paused_.store(false, std::memory_order_release);
}

void AgentLoop::skip_step() {
    skip_.store(true, std::memory_order_release);
}

bool AgentLoop::inject_context(std::string text) {
    auto preview = truncated(text, 50);
    if (!steering_.push(std::move(text))) {
        std::println(stderr, "agent: steering queue full, dropping: {}", preview);
        return false;
    }
    events_.on_thought("Heard: " + preview);
    return true;
}

std::string AgentLoop::extract_thought(const std::string& raw_text) {
    auto observation = tag_section(raw_text, "observation");
    auto reasoning = tag_section(raw_text, "reasoning");

    std::string display;
    if (!observation.empty()) display = truncated(observation, 150);
    if (!reasoning.empty()) {
        if (display.empty()) {
            display = truncated(reasoning, 200);
        } else {
            display += "\n" + truncated(reasoning, 100);
        }
    }
    return display;
}

std::string AgentLoop::build_context(int width, int height, int step) {
    std::string context = std::format("Screen: {}x{}\nStep: {}/{}", width, height, step, options_.max_iterations);

    if (windows_) {
        context += "\n" + describe_windows(windows_->get_focused_window(), windows_->list_windows(),
                                           options_.window_context_limit);
    }

    if (last_error_) {
        context += "\nPrevious issue: " + *last_error_;
    }

    for (auto& text : steering_.drain()) {
        context += "\nUser: " + text;
    }
    return context;
}

TaskResult AgentLoop::finish(TaskResult result, AgentStatus status, const std::string& detail,
                             const std::string& thought) {
    events_.on_status(status, detail);
    events_.on_thought(thought);

    reset_interrupts();
    running_.store(false, std::memory_order_release);
    schedule_idle();
    return result;
}

bool AgentLoop::wait_while_paused() {
    events_.on_status(AgentStatus::Paused, "Paused");
    while (paused() && !abort_requested()) {
        std::this_thread::sleep_for(options_.pause_poll);
    }
    if (abort_requested()) return false;
    events_.on_status(AgentStatus::Running, "Resumed");
    return true;
}

void AgentLoop::reset_interrupts() {
    abort_.store(false, std::memory_order_release);
    paused_.store(false, std::memory_order_release);
    skip_.store(false, std::memory_order_release);
    auto stale = steering_.drain();
    if (!stale.empty()) {
        std::println(stderr, "agent: dropping {} unused steering message(s)", stale.size());
    }
}

void AgentLoop::schedule_idle() {
    cancel_idle();
    idle_timer_ = std::jthread([this, delay = options_.idle_delay](std::stop_token stop) {
        std::mutex m;
        std::condition_variable_any cv;
        std::unique_lock lock(m);
        cv.wait_for(lock, stop, delay, [] { return false; });
        if (!stop.stop_requested()) {
            events_.on_status(AgentStatus::Idle, "");
        }
    });
}

void AgentLoop::cancel_idle() {
    if (idle_timer_.joinable()) {
        idle_timer_.request_stop();
        idle_timer_.join();
    }
}
