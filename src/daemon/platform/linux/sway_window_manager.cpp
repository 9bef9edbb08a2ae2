#include "platform/linux/sway_window_manager.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using json = nlohmann::json;

namespace {

int int_field(const json& node, const char* key) {
    if (node.contains(key) && node[key].is_number_integer()) return node[key].get<int>();
    return 0;
}

WindowRect parse_rect(const json& node) {
    WindowRect r;
    if (node.contains("rect") && node["rect"].is_object()) {
        const auto& j = node["rect"];
        r.x = int_field(j, "x");
        r.y = int_field(j, "y");
        r.width = int_field(j, "width");
        r.height = int_field(j, "height");
    }
    return r;
}

WindowInfo window_from(const json& node, const std::string& workspace) {
    WindowInfo info;
    if (node.contains("app_id") && node["app_id"].is_string()) info.app_id = node["app_id"].get<std::string>();
    if (node.contains("name") && node["name"].is_string()) info.title = node["name"].get<std::string>();
    if (node.contains("window_properties") && node["window_properties"].is_object()) {
        info.window_class = node["window_properties"].value("class", "");
    }
    info.pid = int_field(node, "pid");
    info.focused = node.value("focused", false);
    info.visible = node.value("visible", false);
    info.floating = node.value("type", "") == "floating_con";
    info.workspace = workspace;
    info.rect = parse_rect(node);
    return info;
}

void walk(const json& node, std::string workspace, std::vector<WindowInfo>& out) {
    auto type = node.value("type", "");
    if (type == "workspace") {
        workspace = node.value("name", "");
    }

    // Leaf containers with a client attached are windows.
    bool has_client = int_field(node, "pid") > 0;
    if ((type == "con" || type == "floating_con") && has_client) {
        out.push_back(window_from(node, workspace));
    }

    for (const char* key : {"nodes", "floating_nodes"}) {
        if (!node.contains(key)) continue;
        for (auto& child : node[key]) {
            walk(child, workspace, out);
        }
    }
}

} // namespace

SwayWindowManager::SwayWindowManager() = default;

SwayWindowManager::~SwayWindowManager() {
    if (query_fd_ >= 0) ::close(query_fd_);
    if (event_fd_ >= 0) ::close(event_fd_);
}

bool SwayWindowManager::connect() {
    const char* sock = std::getenv("SWAYSOCK");
    if (!sock) {
        std::println(stderr, "sway: $SWAYSOCK not set");
        return false;
    }
    sway_sock_ = sock;

    query_fd_ = connect_socket(sway_sock_);
    return query_fd_ >= 0;
}

bool SwayWindowManager::subscribe_focus_events() {
    event_fd_ = connect_socket(sway_sock_);
    if (event_fd_ < 0) return false;

    uint32_t type;
    std::string payload;
    if (!send_message(event_fd_, MSG_SUBSCRIBE, R"(["window"])")
        || !recv_message(event_fd_, type, payload)) {
        ::close(event_fd_);
        event_fd_ = -1;
        return false;
    }
    return true;
}

WindowInfo SwayWindowManager::get_focused_window() {
    for (auto& w : list_windows()) {
        if (w.focused) return w;
    }
    return {};
}

std::vector<WindowInfo> SwayWindowManager::list_windows() {
    auto tree = query(MSG_GET_TREE);
    if (!tree) return {};
    return collect_windows(*tree);
}

std::vector<OutputInfo> SwayWindowManager::list_outputs() {
    auto outputs = query(MSG_GET_OUTPUTS);
    if (!outputs) return {};
    return parse_outputs(*outputs);
}

std::expected<void, std::string> SwayWindowManager::run_command(const std::string& command) {
    auto reply = query(MSG_RUN_COMMAND, command);
    if (!reply) return std::unexpected(reply.error());

    if (!reply->is_array()) return std::unexpected("sway: malformed RUN_COMMAND reply");
    for (auto& r : *reply) {
        if (!r.value("success", false)) {
            return std::unexpected("sway: " + r.value("error", std::string("command failed")));
        }
    }
    return {};
}

bool SwayWindowManager::read_event(WindowInfo& info) {
    if (event_fd_ < 0) return false;

    uint32_t type;
    std::string payload;
    if (!recv_message(event_fd_, type, payload)) return false;
    if (type != EVENT_WINDOW) return false;

    auto j = json::parse(payload, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || j.value("change", "") != "focus") return false;
    if (!j.contains("container")) return false;

    info = window_from(j["container"], "");
    info.focused = true;
    return true;
}

std::vector<WindowInfo> SwayWindowManager::collect_windows(const json& tree) {
    std::vector<WindowInfo> windows;
    walk(tree, "", windows);

    // Focused first, then other visible windows, then hidden ones.
    std::ranges::stable_sort(windows, [](const WindowInfo& a, const WindowInfo& b) {
        auto rank = [](const WindowInfo& w) { return w.focused ? 0 : w.visible ? 1 : 2; };
        return rank(a) < rank(b);
    });
    return windows;
}

std::vector<OutputInfo> SwayWindowManager::parse_outputs(const json& outputs) {
    std::vector<OutputInfo> result;
    if (!outputs.is_array()) return result;

    for (auto& o : outputs) {
        OutputInfo info;
        info.name = o.value("name", "");
        info.active = o.value("active", false);
        info.focused = o.value("focused", false);
        if (o.contains("scale") && o["scale"].is_number()) info.scale = o["scale"].get<double>();
        if (info.scale <= 0) info.scale = 1.0;
        info.rect = parse_rect(o);
        result.push_back(std::move(info));
    }
    return result;
}

std::optional<OutputInfo> select_output(const std::vector<OutputInfo>& outputs, const std::string& name) {
    if (!name.empty()) {
        auto it = std::ranges::find_if(outputs, [&](const OutputInfo& o) { return o.name == name; });
        if (it != outputs.end()) return *it;
        return std::nullopt;
    }

    auto origin = std::ranges::find_if(outputs, [](const OutputInfo& o) {
        return o.active && o.rect.x == 0 && o.rect.y == 0;
    });
    if (origin != outputs.end()) return *origin;

    auto active = std::ranges::find_if(outputs, [](const OutputInfo& o) { return o.active; });
    if (active != outputs.end()) return *active;
    return std::nullopt;
}

std::expected<json, std::string> SwayWindowManager::query(uint32_t type, const std::string& payload) {
    std::lock_guard lock(query_mutex_);
    if (query_fd_ < 0) return std::unexpected("sway: not connected");

    uint32_t reply_type;
    std::string reply;
    if (!send_message(query_fd_, type, payload) || !recv_message(query_fd_, reply_type, reply)) {
        return std::unexpected("sway: IPC request failed");
    }

    auto j = json::parse(reply, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) return std::unexpected("sway: malformed IPC reply");
    return j;
}

int SwayWindowManager::connect_socket(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "sway: connect failed: {}", std::strerror(errno));
        ::close(fd);
        return -1;
    }
    return fd;
}

bool SwayWindowManager::send_message(int fd, uint32_t type, const std::string& payload) {
    // Header: "i3-ipc" (6 bytes) + length (4 bytes) + type (4 bytes), native endian
    uint32_t len = static_cast<uint32_t>(payload.size());
    char header[14];
    std::memcpy(header, MAGIC, 6);
    std::memcpy(header + 6, &len, 4);
    std::memcpy(header + 10, &type, 4);

    if (::send(fd, header, 14, MSG_NOSIGNAL) != 14) return false;
    if (len > 0 && ::send(fd, payload.data(), len, MSG_NOSIGNAL) != static_cast<ssize_t>(len)) {
        return false;
    }
    return true;
}

bool SwayWindowManager::recv_message(int fd, uint32_t& type, std::string& payload) {
    char header[14];
    size_t read_total = 0;
    while (read_total < 14) {
        ssize_t n = ::recv(fd, header + read_total, 14 - read_total, 0);
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    if (std::memcmp(header, MAGIC, 6) != 0) return false;

    uint32_t len;
    std::memcpy(&len, header + 6, 4);
    std::memcpy(&type, header + 10, 4);

    payload.resize(len);
    read_total = 0;
    while (read_total < len) {
        ssize_t n = ::recv(fd, payload.data() + read_total, len - read_total, 0);
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }
    return true;
}
