#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "inference/curl_transport.hpp"
#include "platform/linux/grim_capture.hpp"
#include "platform/linux/sway_window_manager.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "platform/linux/wayland_input.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

    // Queues `task` and makes run() return once it has finished.
    void run_once(const std::string& task);
    std::optional<FinishedTask> oneshot_result() const { return oneshot_result_; }

private:
    void handle_client(int fd);
    void drop_client(int fd);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    SwayWindowManager window_mgr_;
    GrimCapture screen_capture_;
    WaylandInput input_;
    UnixSocketServer ipc_server_;
    CurlTransport transport_;

    // Portable business logic, built once the window manager is probed
    std::unique_ptr<DaemonCore> core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;

    std::optional<uint64_t> oneshot_id_;
    std::optional<FinishedTask> oneshot_result_;

    std::atomic<bool> running_{false};
};
