#include "daemon_core.hpp"

#include "platform/platform_paths.hpp"
#include "prompts.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <format>
#include <print>

using json = nlohmann::json;

namespace {

std::chrono::milliseconds seconds_to_ms(double s) {
    return std::chrono::milliseconds(static_cast<int64_t>(std::lround(s * 1000.0)));
}

InferenceClient::Options inference_options(const Config& config) {
    return {
        .base_url = config.model.url,
        .model = config.model.name,
        .system_prompt = prompts::system_prompt(),
        .temperature = config.model.temperature,
        .top_p = config.model.top_p,
        .timeout = std::chrono::seconds(config.model.timeout_s),
    };
}

ActionExecutor::Options executor_options(const Config& config) {
    return {
        .confidence_threshold = config.safety.confidence_threshold,
        .action_delay = seconds_to_ms(config.safety.action_delay_s),
        .pause_before_action = seconds_to_ms(config.safety.pause_before_action_s),
        .max_duration_s = config.safety.max_action_duration_s,
        .failsafe = config.safety.failsafe,
    };
}

StabilityGate::Options stability_options(const Config& config) {
    return {
        .threshold = config.stability.threshold,
        .max_wait = seconds_to_ms(config.stability.max_wait_s),
        .check_interval = seconds_to_ms(config.stability.check_interval_s),
        .min_stable_frames = config.stability.min_stable_frames,
    };
}

AgentLoop::Options agent_options(const Config& config) {
    return {
        .max_iterations = config.agent.max_iterations,
        .max_tokens = config.model.max_tokens,
        .max_image_size = static_cast<int>(config.capture.max_image_size),
        .offset = {config.coordinates.click_offset_x, config.coordinates.click_offset_y},
        .stability_enabled = config.stability.enabled,
        .settle = seconds_to_ms(config.stability.settle_s),
        .idle_delay = std::chrono::milliseconds(config.agent.idle_delay_ms),
    };
}

// Client fields of the wrong type fall back to the default.
int int_field(const json& cmd, const char* key, int fallback) {
    auto it = cmd.find(key);
    if (it == cmd.end() || !it->is_number_integer()) return fallback;
    return it->get<int>();
}

bool bool_field(const json& cmd, const char* key, bool fallback) {
    auto it = cmd.find(key);
    if (it == cmd.end() || !it->is_boolean()) return fallback;
    return it->get<bool>();
}

json window_json(const WindowInfo& w) {
    if (w.empty()) return nullptr;
    return {{"app_id", w.app()}, {"title", w.title}};
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose,
                       ScreenCapture& capture, InputInjector& input, WindowManager* windows,
                       IpcServer& ipc, HttpTransport& transport, NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      capture_(capture), input_(input), windows_(windows),
      ipc_(ipc), transport_(transport),
      notify_(std::move(notify)),
      inference_(transport_, inference_options(config_)),
      executor_(input_, executor_options(config_)),
      stability_(capture_, stability_options(config_)),
      agent_(capture_, inference_, executor_, stability_, windows_, *this, agent_options(config_)) {}

DaemonCore::~DaemonCore() {
    shutdown();
}

bool DaemonCore::init(const std::string& db_path) {
    std::string path = db_path;
    if (path.empty()) {
        auto data = platform::data_dir();
        path = !data.empty() ? data + "/tasks.db" : "/tmp/deskpilot/tasks.db";
    }
    if (!history_db_.open(path)) {
        std::println(stderr, "Warning: task journal failed to open, history disabled");
    }

    worker_ = std::jthread([this](std::stop_token stop) { worker_main(stop); });
    return true;
}

json DaemonCore::handle_command(const std::string& cmd_str, const json& cmd) {
    if (cmd_str == "run" || cmd_str == "submit") return handle_run(cmd);
    if (cmd_str == "abort") return handle_abort(cmd);
    if (cmd_str == "pause") return handle_pause(cmd);
    if (cmd_str == "resume") return handle_resume(cmd);
    if (cmd_str == "skip") return handle_skip(cmd);
    if (cmd_str == "steer") return handle_steer(cmd);
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "history") return handle_history(cmd);
    if (cmd_str == "frame") return handle_frame(cmd);
    if (cmd_str == "subscribe") return {{"status", "subscribed"}, {"frames", bool_field(cmd, "frames", false)}};
    return {{"status", "error"}, {"message", "unknown command"}};
}

uint64_t DaemonCore::enqueue(const std::string& task) {
    uint64_t id = queue_.push(task);
    task_context_[id] = focused_window_;
    log(std::format("Task {} queued: {}", id, task));
    return id;
}

json DaemonCore::handle_run(const json& cmd) {
    std::string task;
    if (cmd.contains("task") && cmd["task"].is_string()) {
        task = cmd["task"].get<std::string>();
    }
    if (task.find_first_not_of(" \t\r\n") == std::string::npos) {
        return {{"status", "error"}, {"message", "empty task"}};
    }

    uint64_t id = enqueue(task);
    return {{"status", "queued"}, {"id", id}, {"position", queue_.size()}};
}

json DaemonCore::handle_abort(const json& /*cmd*/) {
    size_t dropped = queue_.clear();
    if (dropped > 0) log(std::format("Dropped {} queued task(s)", dropped));

    if (!busy_.load(std::memory_order_acquire)) {
        if (dropped == 0) return {{"status", "error"}, {"message", "no task running"}};
        return {{"status", "ok"}, {"dropped", dropped}};
    }

    agent_.abort();
    log("Abort requested");
    return {{"status", "ok"}, {"dropped", dropped}};
}

json DaemonCore::handle_pause(const json& /*cmd*/) {
    if (!busy_.load(std::memory_order_acquire)) {
        return {{"status", "error"}, {"message", "no task running"}};
    }
    agent_.pause();
    log("Pause requested");
    return {{"status", "ok"}};
}

json DaemonCore::handle_resume(const json& /*cmd*/) {
    if (!agent_.paused()) {
        return {{"status", "error"}, {"message", "not paused"}};
    }
    agent_.resume();
    log("Resume requested");
    return {{"status", "ok"}};
}

json DaemonCore::handle_skip(const json& /*cmd*/) {
    if (!busy_.load(std::memory_order_acquire)) {
        return {{"status", "error"}, {"message", "no task running"}};
    }
    agent_.skip_step();
    log("Skip requested");
    return {{"status", "ok"}};
}

json DaemonCore::handle_steer(const json& cmd) {
    std::string text;
    if (cmd.contains("text") && cmd["text"].is_string()) {
        text = cmd["text"].get<std::string>();
    }
    if (text.empty()) {
        return {{"status", "error"}, {"message", "empty steering text"}};
    }
    if (!agent_.inject_context(std::move(text))) {
        return {{"status", "error"}, {"message", "steering queue full"}};
    }
    return {{"status", "ok"}};
}

json DaemonCore::handle_status(const json& /*cmd*/) {
    json resp = {{"status", "ok"}};
    {
        std::lock_guard lock(state_mutex_);
        resp["state"] = to_string(status_);
        resp["detail"] = status_detail_;
        if (current_task_) {
            resp["task"] = {{"id", current_task_->id}, {"text", current_task_->text}};
        }
    }
    resp["paused"] = agent_.paused();
    resp["queued"] = queue_.size();
    resp["window"] = window_json(focused_window_);
    return resp;
}

json DaemonCore::handle_history(const json& cmd) {
    int limit = int_field(cmd, "limit", 10);
    if (limit <= 0) limit = 10;
    auto entries = history_db_.recent(limit);

    json resp = {{"status", "ok"}, {"entries", json::array()}};
    for (auto& e : entries) {
        resp["entries"].push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"task", e.task},
            {"success", e.success},
            {"message", e.message},
            {"steps", e.steps},
            {"duration", e.duration},
            {"error", e.error},
            {"app_id", e.app_id},
            {"window_title", e.window_title},
        });
    }
    return resp;
}

json DaemonCore::handle_frame(const json& /*cmd*/) {
    std::lock_guard lock(state_mutex_);
    if (latest_frame_.image.empty()) {
        return {{"status", "error"}, {"message", "no frame captured yet"}};
    }
    return {
        {"status", "ok"},
        {"width", latest_frame_.width},
        {"height", latest_frame_.height},
        {"format", "bmp"},
        {"image", latest_frame_.image},
    };
}

void DaemonCore::worker_main(std::stop_token stop) {
    while (auto task = queue_.pop(stop)) {
        busy_.store(true, std::memory_order_release);
        {
            std::lock_guard lock(state_mutex_);
            current_task_ = *task;
        }

        TaskResult result;
        bool ready = inference_.wait_for_server(std::chrono::seconds(config_.model.startup_wait_s));
        if (!ready && !agent_.abort_requested()) {
            std::string why = "Model server at " + config_.model.url + " is not available";
            log(why);
            on_status(AgentStatus::Error, why);
            result = {false, "Model server unavailable", 0, 0.0, why};
        } else {
            // An abort during the wait makes run_task return at its first check.
            result = agent_.run_task(task->text);
        }

        {
            std::lock_guard lock(state_mutex_);
            current_task_.reset();
        }
        busy_.store(false, std::memory_order_release);
        // Covers the unavailable path and interrupts that land after run_task()
        // returned.
        agent_.reset_interrupts();

        post({
            {"event", "task_done"},
            {"id", task->id},
            {"task", task->text},
            {"success", result.success},
            {"message", result.message},
            {"steps", result.steps_taken},
            {"duration", result.duration_seconds},
            {"error", result.error ? json(*result.error) : json(nullptr)},
        });
    }
}

void DaemonCore::on_status(AgentStatus status, const std::string& detail) {
    {
        std::lock_guard lock(state_mutex_);
        status_ = status;
        status_detail_ = detail;
    }
    post({{"event", "status"}, {"state", to_string(status)}, {"detail", detail}});
}

void DaemonCore::on_thought(const std::string& text) {
    post({{"event", "thought"}, {"text", text}});
}

void DaemonCore::on_action(ActionKind kind, const std::string& target) {
    post({{"event", "action"}, {"action", to_string(kind)}, {"target", target}});
}

void DaemonCore::on_frame(int width, int height, const std::string& image_base64) {
    {
        std::lock_guard lock(state_mutex_);
        latest_frame_ = {width, height, image_base64};
    }
    // Frame events carry only the size; subscribers with frames enabled get
    // the image attached when the outbox is flushed.
    post({{"event", "frame"}, {"width", width}, {"height", height}});
}

void DaemonCore::post(json event) {
    {
        std::lock_guard lock(outbox_mutex_);
        outbox_.push_back(std::move(event));
    }
    if (notify_) notify_();
}

std::vector<FinishedTask> DaemonCore::flush_events() {
    std::vector<json> events;
    {
        std::lock_guard lock(outbox_mutex_);
        events.swap(outbox_);
    }

    std::vector<FinishedTask> finished;
    for (auto& event : events) {
        auto type = event.value("event", "");

        if (type == "status") {
            log(std::format("Status: {} {}", event.value("state", ""), event.value("detail", "")));
        } else if (type == "thought") {
            log("Thought: " + event.value("text", ""));
        } else if (type == "action") {
            log(std::format("Action: {} on '{}'", event.value("action", ""), event.value("target", "")));
        } else if (type == "task_done") {
            uint64_t id = event["id"].get<uint64_t>();
            bool success = event["success"].get<bool>();
            std::optional<std::string> error;
            if (event["error"].is_string()) error = event["error"].get<std::string>();

            WindowInfo context;
            if (auto it = task_context_.find(id); it != task_context_.end()) {
                context = std::move(it->second);
                task_context_.erase(it);
            }

            history_db_.insert(event["task"].get<std::string>(), success, event.value("message", ""),
                               event.value("steps", 0), event.value("duration", 0.0), error, context);
            log(std::format("Task {} finished: {} ({} steps, {:.1f}s)", id, event.value("message", ""),
                            event.value("steps", 0), event.value("duration", 0.0)));

            json reply = event;
            reply.erase("event");
            reply["status"] = success ? "ok" : "error";
            std::vector<int> fds;
            for (auto& w : waiting_clients_) {
                if (w.task_id == id) fds.push_back(w.fd);
            }
            std::erase_if(waiting_clients_, [id](const WaitingClient& w) { return w.task_id == id; });
            for (int fd : fds) send_or_drop(fd, reply);

            finished.push_back({id, success, event.value("message", "")});
        }

        if (subscribers_.empty()) continue;

        json with_image;
        if (type == "frame") {
            std::lock_guard lock(state_mutex_);
            with_image = event;
            with_image["image"] = latest_frame_.image;
        }

        // Copy: send_or_drop() may remove subscribers.
        auto subs = subscribers_;
        for (auto& s : subs) {
            send_or_drop(s.fd, type == "frame" && s.frames ? with_image : event);
        }
    }
    return finished;
}

void DaemonCore::send_or_drop(int fd, const json& msg) {
    if (ipc_.send_response(fd, msg)) return;
    log(std::format("Client {} stopped reading, disconnecting", fd));
    remove_client(fd);
    ipc_.close_client(fd);
}

void DaemonCore::add_waiting_client(int fd, uint64_t task_id) {
    waiting_clients_.push_back({fd, task_id});
}

void DaemonCore::add_subscriber(int fd, bool frames) {
    subscribers_.push_back({fd, frames});
    log(std::format("Client {} subscribed{}", fd, frames ? " (with frames)" : ""));
}

void DaemonCore::remove_client(int fd) {
    std::erase_if(waiting_clients_, [fd](const WaitingClient& w) { return w.fd == fd; });
    std::erase_if(subscribers_, [fd](const Subscriber& s) { return s.fd == fd; });
}

void DaemonCore::set_focused_window(const WindowInfo& info) {
    focused_window_ = info;
}

void DaemonCore::shutdown() {
    if (!worker_.joinable()) return;

    size_t dropped = queue_.clear();
    if (busy_.load(std::memory_order_acquire)) {
        log("Aborting running task...");
        agent_.abort();
    }
    if (dropped > 0) log(std::format("Dropped {} queued task(s)", dropped));

    worker_.request_stop();
    worker_.join();
    flush_events();
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[deskpilot] {}", msg);
    }
}
