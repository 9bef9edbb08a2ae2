#pragma once

#include "action_executor.hpp"
#include "agent_loop.hpp"
#include "config.hpp"
#include "event_sink.hpp"
#include "inference/inference_client.hpp"
#include "inference/transport.hpp"
#include "platform/input_injector.hpp"
#include "platform/ipc_server.hpp"
#include "platform/screen_capture.hpp"
#include "platform/window_manager.hpp"
#include "stability_gate.hpp"
#include "storage/task_history_db.hpp"
#include "sway/window_info.hpp"
#include "task_queue.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

struct FinishedTask {
    uint64_t id = 0;
    bool success = false;
    std::string message;
};

// Owns the agent and its worker thread, and answers control commands.
// handle_command(), flush_events() and the client bookkeeping run on the
// event loop thread; the EventSink callbacks arrive from the agent thread and
// are handed over through an outbox plus `notify`.
class DaemonCore : public EventSink {
public:
    using NotifyCallback = std::function<void()>;

    DaemonCore(Config config, bool verbose,
               ScreenCapture& capture, InputInjector& input, WindowManager* windows,
               IpcServer& ipc, HttpTransport& transport, NotifyCallback notify);
    ~DaemonCore() override;

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // `db_path` overrides the journal location (tests use ":memory:").
    bool init(const std::string& db_path = "");

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    // Queues a task and returns its id.
    uint64_t enqueue(const std::string& task);

    // Delivers pending agent events to subscribers and waiting clients, and
    // journals finished tasks. Returns the tasks that finished.
    std::vector<FinishedTask> flush_events();

    void add_waiting_client(int fd, uint64_t task_id);
    void add_subscriber(int fd, bool frames);
    void remove_client(int fd);

    void set_focused_window(const WindowInfo& info);

    void shutdown();

    // EventSink
    void on_status(AgentStatus status, const std::string& detail) override;
    void on_thought(const std::string& text) override;
    void on_action(ActionKind kind, const std::string& target) override;
    void on_frame(int width, int height, const std::string& image_base64) override;

private:
    nlohmann::json handle_run(const nlohmann::json& cmd);
    nlohmann::json handle_abort(const nlohmann::json& cmd);
    nlohmann::json handle_pause(const nlohmann::json& cmd);
    nlohmann::json handle_resume(const nlohmann::json& cmd);
    nlohmann::json handle_skip(const nlohmann::json& cmd);
    nlohmann::json handle_steer(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_frame(const nlohmann::json& cmd);

    void worker_main(std::stop_token stop);
    void post(nlohmann::json event);
    void send_or_drop(int fd, const nlohmann::json& msg);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    ScreenCapture& capture_;
    InputInjector& input_;
    WindowManager* windows_;
    IpcServer& ipc_;
    HttpTransport& transport_;
    NotifyCallback notify_;

    InferenceClient inference_;
    ActionExecutor executor_;
    StabilityGate stability_;
    AgentLoop agent_;
    TaskQueue queue_;
    TaskHistoryDb history_db_;

    // Event loop thread only.
    WindowInfo focused_window_;
    std::unordered_map<uint64_t, WindowInfo> task_context_;
    struct WaitingClient {
        int fd;
        uint64_t task_id;
    };
    std::vector<WaitingClient> waiting_clients_;
    struct Subscriber {
        int fd;
        bool frames;
    };
    std::vector<Subscriber> subscribers_;

    // Shared with the agent thread.
    std::mutex outbox_mutex_;
    std::vector<nlohmann::json> outbox_;

    std::mutex state_mutex_;
    AgentStatus status_ = AgentStatus::Idle;
    std::string status_detail_;
    std::optional<QueuedTask> current_task_;
    struct LatestFrame {
        int width = 0;
        int height = 0;
        std::string image;
    } latest_frame_;

    std::atomic<bool> busy_{false};
    std::jthread worker_;
};
