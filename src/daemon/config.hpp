#pragma once

#include <cstdint>
#include <string>

struct Config {
    struct Model {
        std::string url = "http://127.0.0.1:8080";
        std::string name = "qwen3-vl";
        int timeout_s = 120;
        int max_tokens = 1024;
        double temperature = 0.7;
        double top_p = 0.8;
        int startup_wait_s = 60;  // how long a task waits for /health before giving up
    } model;

    struct Agent {
        int max_iterations = 10;
        int idle_delay_ms = 3000;
    } agent;

    struct Safety {
        double confidence_threshold = 0.8;
        double action_delay_s = 0.5;
        double pause_before_action_s = 0.1;
        double max_action_duration_s = 10.0;
        bool failsafe = true;
    } safety;

    struct Stability {
        bool enabled = true;
        double threshold = 0.02;
        double max_wait_s = 3.0;
        double check_interval_s = 0.15;
        int min_stable_frames = 2;
        double settle_s = 1.5;  // fixed sleep used when the gate is disabled
    } stability;

    struct Coordinates {
        int click_offset_x = 0;
        int click_offset_y = 0;
    } coordinates;

    struct Capture {
        std::string output;  // sway output name, empty = output at the layout origin
        uint32_t max_image_size = 1080;
    } capture;

    static Config load(const std::string& path);
    static Config load_default();
};
