#pragma once

#include "platform/window_manager.hpp"

#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

class SwayWindowManager : public WindowManager {
public:
    SwayWindowManager();
    ~SwayWindowManager() override;

    SwayWindowManager(const SwayWindowManager&) = delete;
    SwayWindowManager& operator=(const SwayWindowManager&) = delete;

    bool connect() override;
    bool subscribe_focus_events() override;
    WindowInfo get_focused_window() override;
    std::vector<WindowInfo> list_windows() override;
    std::vector<OutputInfo> list_outputs() override;
    std::expected<void, std::string> run_command(const std::string& command) override;
    int event_fd() const override { return event_fd_; }
    bool read_event(WindowInfo& info) override;

    // Exposed for tests: flatten a GET_TREE reply / parse a GET_OUTPUTS reply.
    static std::vector<WindowInfo> collect_windows(const nlohmann::json& tree);
    static std::vector<OutputInfo> parse_outputs(const nlohmann::json& outputs);

private:
    static constexpr char MAGIC[] = "i3-ipc";
    static constexpr uint32_t MSG_RUN_COMMAND = 0;
    static constexpr uint32_t MSG_SUBSCRIBE = 2;
    static constexpr uint32_t MSG_GET_OUTPUTS = 3;
    static constexpr uint32_t MSG_GET_TREE = 4;
    static constexpr uint32_t EVENT_WINDOW = 0x80000003;

    bool send_message(int fd, uint32_t type, const std::string& payload = "");
    bool recv_message(int fd, uint32_t& type, std::string& payload);
    std::expected<nlohmann::json, std::string> query(uint32_t type, const std::string& payload = "");
    int connect_socket(const std::string& path);

    int query_fd_ = -1;   // GET_TREE, GET_OUTPUTS, RUN_COMMAND (agent thread)
    int event_fd_ = -1;   // subscribed window events (event loop thread)
    std::mutex query_mutex_;
    std::string sway_sock_;
};

// The output named `name`, or when empty the active output at the layout
// origin, or else the first active output.
std::optional<OutputInfo> select_output(const std::vector<OutputInfo>& outputs, const std::string& name);
