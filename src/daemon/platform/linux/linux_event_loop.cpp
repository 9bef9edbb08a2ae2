#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      screen_capture_(&window_mgr_, config_.capture.output),
      input_(&window_mgr_, config_.capture.output) {}

LinuxEventLoop::~LinuxEventLoop() {
    core_.reset();
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
}

bool LinuxEventLoop::init() {
    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // Worker notification eventfd, needed before the core starts its worker
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    // Window manager (optional)
    bool have_sway = window_mgr_.connect();
    if (have_sway) {
        if (window_mgr_.subscribe_focus_events()) {
            log("Sway IPC connected");
        }
    } else {
        log("Sway IPC not available (window context and window actions disabled)");
    }

    core_ = std::make_unique<DaemonCore>(
        config_, verbose_, screen_capture_, input_,
        have_sway ? &window_mgr_ : nullptr,
        ipc_server_, transport_,
        // NotifyCallback
        [this]() {
            uint64_t val = 1;
            if (::write(worker_event_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
                std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
            }
        });

    if (have_sway) {
        core_->set_focused_window(window_mgr_.get_focused_window());
    }

    // Core init (task journal, agent worker)
    if (!core_->init()) return false;

    // epoll setup
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Register FDs with epoll
    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(ipc_server_.server_fd(), EPOLLIN)
        || !add_fd(worker_event_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    if (window_mgr_.event_fd() >= 0) {
        add_fd(window_mgr_.event_fd(), EPOLLIN);
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run_once(const std::string& task) {
    oneshot_id_ = core_->enqueue(task);
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) < 0) continue;
                log("Received signal, shutting down");
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev);
                }
                continue;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                if (::read(worker_event_fd_, &val, sizeof(val)) < 0) continue;
                for (auto& done : core_->flush_events()) {
                    if (oneshot_id_ && done.id == *oneshot_id_) {
                        oneshot_result_ = done;
                        running_.store(false, std::memory_order_release);
                    }
                }
                continue;
            }

            if (fd == window_mgr_.event_fd()) {
                WindowInfo info;
                if (window_mgr_.read_event(info)) {
                    core_->set_focused_window(info);
                }
                continue;
            }

            handle_client(fd);
        }
    }

    // Clean shutdown
    core_->shutdown();
}

void LinuxEventLoop::handle_client(int fd) {
    std::vector<nlohmann::json> cmds;
    bool open = ipc_server_.read_commands(fd, cmds);

    for (auto& cmd : cmds) {
        std::string cmd_str = cmd.value("cmd", "");
        auto response = core_->handle_command(cmd_str, cmd);
        auto status = response.value("status", "");

        if (status == "queued" && cmd_str == "run") {
            // Answered when the task finishes
            core_->add_waiting_client(fd, response["id"].get<uint64_t>());
            continue;
        }
        if (status == "subscribed") {
            core_->add_subscriber(fd, response.value("frames", false));
            response["status"] = "ok";
        }
        if (!ipc_server_.send_response(fd, response)) {
            open = false;
            break;
        }
    }

    if (!open) drop_client(fd);
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    core_->remove_client(fd);
    ipc_server_.close_client(fd);
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[deskpilot] {}", msg);
    }
}
