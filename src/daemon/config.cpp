#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("model")) {
            auto& m = j["model"];
            if (m.contains("url")) cfg.model.url = m["url"].get<std::string>();
            if (m.contains("name")) cfg.model.name = m["name"].get<std::string>();
            if (m.contains("timeout_s")) cfg.model.timeout_s = m["timeout_s"].get<int>();
            if (m.contains("max_tokens")) cfg.model.max_tokens = m["max_tokens"].get<int>();
            if (m.contains("temperature")) cfg.model.temperature = m["temperature"].get<double>();
            if (m.contains("top_p")) cfg.model.top_p = m["top_p"].get<double>();
            if (m.contains("startup_wait_s")) cfg.model.startup_wait_s = m["startup_wait_s"].get<int>();
        }

        if (j.contains("agent")) {
            auto& a = j["agent"];
            if (a.contains("max_iterations")) cfg.agent.max_iterations = a["max_iterations"].get<int>();
            if (a.contains("idle_delay_ms")) cfg.agent.idle_delay_ms = a["idle_delay_ms"].get<int>();
        }

        if (j.contains("safety")) {
            auto& s = j["safety"];
            if (s.contains("confidence_threshold"))
                cfg.safety.confidence_threshold = s["confidence_threshold"].get<double>();
            if (s.contains("action_delay_s")) cfg.safety.action_delay_s = s["action_delay_s"].get<double>();
            if (s.contains("pause_before_action_s"))
                cfg.safety.pause_before_action_s = s["pause_before_action_s"].get<double>();
            if (s.contains("max_action_duration_s"))
                cfg.safety.max_action_duration_s = s["max_action_duration_s"].get<double>();
            if (s.contains("failsafe")) cfg.safety.failsafe = s["failsafe"].get<bool>();
        }

        if (j.contains("stability")) {
            auto& s = j["stability"];
            if (s.contains("enabled")) cfg.stability.enabled = s["enabled"].get<bool>();
            if (s.contains("threshold")) cfg.stability.threshold = s["threshold"].get<double>();
            if (s.contains("max_wait_s")) cfg.stability.max_wait_s = s["max_wait_s"].get<double>();
            if (s.contains("check_interval_s"))
                cfg.stability.check_interval_s = s["check_interval_s"].get<double>();
            if (s.contains("min_stable_frames"))
                cfg.stability.min_stable_frames = s["min_stable_frames"].get<int>();
            if (s.contains("settle_s")) cfg.stability.settle_s = s["settle_s"].get<double>();
        }

        if (j.contains("coordinates")) {
            auto& c = j["coordinates"];
            if (c.contains("click_offset_x")) cfg.coordinates.click_offset_x = c["click_offset_x"].get<int>();
            if (c.contains("click_offset_y")) cfg.coordinates.click_offset_y = c["click_offset_y"].get<int>();
        }

        if (j.contains("capture")) {
            auto& c = j["capture"];
            if (c.contains("output")) cfg.capture.output = c["output"].get<std::string>();
            if (c.contains("max_image_size")) cfg.capture.max_image_size = c["max_image_size"].get<uint32_t>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
