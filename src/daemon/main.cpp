#include "config.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"

#include <print>
#include <string>

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    std::string config_path;
    std::string task;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--task" || arg == "-t") {
            if (i + 1 < argc) task = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: deskpilotd [options]");
            std::println("Options:");
            std::println("  -f, --foreground    Run in foreground (don't daemonize)");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -t, --task TEXT     Run one task in the foreground and exit");
            std::println("  -h, --help          Show this help");
            return 0;
        } else {
            std::println(stderr, "Unknown option: {} (see --help)", arg);
            return 1;
        }
    }

    // Load config
    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }

    // A one-shot task reports its result on this terminal.
    if (!task.empty()) foreground = true;

    if (!foreground) {
        platform::daemonize();
    }

    if (verbose && foreground) {
        std::println(stderr, "[deskpilot] Starting (model: {} @ {})",
                     config.model.name, config.model.url);
    }

    LinuxEventLoop loop(std::move(config), verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    if (!task.empty()) {
        loop.run_once(task);
    }

    loop.run();

    if (!task.empty()) {
        auto result = loop.oneshot_result();
        if (!result) {
            std::println(stderr, "Interrupted before the task finished");
            return 1;
        }
        if (result->success) {
            std::println("Task complete");
        } else {
            std::println("Task failed: {}", result->message);
        }
        return result->success ? 0 : 1;
    }
    return 0;
}
