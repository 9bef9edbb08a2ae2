#include "base64.hpp"
#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  run TASK...                       Run a task and wait for the result");
    std::println(stderr, "  submit TASK...                    Queue a task and return");
    std::println(stderr, "  abort                             Abort the running task, drop queued ones");
    std::println(stderr, "  pause | resume                    Pause or resume the running task");
    std::println(stderr, "  skip                              Skip the next step");
    std::println(stderr, "  steer TEXT...                     Send guidance to the running task");
    std::println(stderr, "  status                            Show daemon status");
    std::println(stderr, "  history [--limit N]               Show finished tasks");
    std::println(stderr, "  frame --out PATH                  Save the latest screenshot (BMP)");
    std::println(stderr, "  watch [--frames [--out PATH]]     Stream agent events");
}

static bool write_frame(const json& msg, const std::string& path) {
    auto bytes = base64::decode(msg.value("image", ""));
    if (!bytes) {
        std::println(stderr, "Bad frame data: {}", bytes.error());
        return false;
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes->data()), static_cast<std::streamsize>(bytes->size()));
    if (!out) {
        std::println(stderr, "Failed to write {}", path);
        return false;
    }
    return true;
}

static void print_event(const json& ev) {
    auto type = ev.value("event", "");
    if (type == "status") {
        auto detail = ev.value("detail", "");
        std::println("[status] {}{}", ev.value("state", ""), detail.empty() ? "" : ": " + detail);
    } else if (type == "thought") {
        std::println("[thought] {}", ev.value("text", ""));
    } else if (type == "action") {
        std::println("[action] {} on '{}'", ev.value("action", ""), ev.value("target", ""));
    } else if (type == "frame") {
        std::println("[frame] {}x{}", ev.value("width", 0), ev.value("height", 0));
    } else if (type == "task_done") {
        std::println("[done] task {}: {} ({} steps, {:.1f}s)", ev.value("id", 0), ev.value("message", ""),
                     ev.value("steps", 0), ev.value("duration", 0.0));
    } else {
        std::println("{}", ev.dump());
    }
}

static int watch(UnixSocketClient& client, const std::string& out_path) {
    json msg;
    while (client.recv(msg, -1)) {
        if (msg.contains("status")) continue;  // subscribe acknowledgement
        print_event(msg);
        if (msg.value("event", "") == "frame" && msg.contains("image") && !out_path.empty()) {
            write_frame(msg, out_path);
        }
        std::fflush(stdout);
    }
    std::println(stderr, "Daemon closed the connection");
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    int limit = 10;
    bool frames = false;
    std::string out_path;
    std::vector<std::string> words;

    // Parse optional args; everything else is free text (task or steering)
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (arg == "--out" && i + 1 < argc) {
            out_path = argv[++i];
        } else if (arg == "--frames") {
            frames = true;
        } else {
            words.push_back(arg);
        }
    }

    std::string text;
    for (auto& w : words) {
        if (!text.empty()) text += ' ';
        text += w;
    }

    // Build command JSON
    json cmd;
    if (command == "run" || command == "submit") {
        if (text.empty()) {
            std::println(stderr, "{}: missing task text", command);
            return 1;
        }
        cmd = {{"cmd", command}, {"task", text}};
    } else if (command == "steer") {
        if (text.empty()) {
            std::println(stderr, "steer: missing text");
            return 1;
        }
        cmd = {{"cmd", "steer"}, {"text", text}};
    } else if (command == "abort" || command == "pause" || command == "resume"
               || command == "skip" || command == "status") {
        cmd = {{"cmd", command}};
    } else if (command == "history") {
        cmd = {{"cmd", "history"}, {"limit", limit}};
    } else if (command == "frame") {
        if (out_path.empty()) {
            std::println(stderr, "frame: --out PATH is required");
            return 1;
        }
        cmd = {{"cmd", "frame"}};
    } else if (command == "watch") {
        cmd = {{"cmd", "subscribe"}, {"frames", frames}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    // Connect and send
    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is deskpilotd running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    if (command == "watch") return watch(client, out_path);

    // A task runs for as long as it takes.
    json response;
    if (!client.recv(response, command == "run" ? -1 : 30000)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    // Display response
    auto status = response.value("status", "");

    if (command == "status" && status == "ok") {
        std::println("State: {}", response.value("state", "unknown"));
        auto detail = response.value("detail", "");
        if (!detail.empty()) std::println("Detail: {}", detail);
        if (response.contains("task")) {
            std::println("Task {}: {}", response["task"].value("id", 0), response["task"].value("text", ""));
        }
        if (response.value("paused", false)) std::println("Paused");
        std::println("Queued: {}", response.value("queued", 0));
        if (response.contains("window") && response["window"].is_object()) {
            std::println("Window: {} ({})", response["window"].value("title", ""),
                         response["window"].value("app_id", ""));
        }
    } else if (command == "history" && status == "ok") {
        for (auto& entry : response["entries"]) {
            std::println("[{}] {} {}", entry.value("timestamp", ""),
                         entry.value("success", false) ? "OK  " : "FAIL", entry.value("task", ""));
            std::println("  {} ({} steps, {:.1f}s)", entry.value("message", ""),
                         entry.value("steps", 0), entry.value("duration", 0.0));
            if (entry.contains("error") && entry["error"].is_string() && !entry["error"].get<std::string>().empty()) {
                std::println("  Error: {}", entry["error"].get<std::string>());
            }
        }
    } else if (command == "frame" && status == "ok") {
        if (!write_frame(response, out_path)) return 1;
        std::println("Saved {}x{} frame to {}", response.value("width", 0), response.value("height", 0), out_path);
    } else if (command == "submit" && status == "queued") {
        std::println("Queued task {} (position {})", response.value("id", 0), response.value("position", 0));
    } else if (command == "run" && response.contains("success")) {
        std::println("{} ({} steps, {:.1f}s)", response.value("message", ""),
                     response.value("steps", 0), response.value("duration", 0.0));
        if (response.contains("error") && response["error"].is_string()) {
            std::println(stderr, "Error: {}", response["error"].get<std::string>());
        }
        return response.value("success", false) ? 0 : 1;
    } else if (status == "ok") {
        std::println("OK");
    } else if (status == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    } else {
        std::println("{}", response.dump(2));
    }

    return 0;
}
