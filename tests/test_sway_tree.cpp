#include <catch2/catch_test_macros.hpp>

#include "platform/linux/sway_window_manager.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

// Two workspaces: "1" holds a focused terminal and a floating dialog,
// "2" holds a hidden browser.
json sample_tree() {
    return json::parse(R"({
        "type": "root", "name": "root", "nodes": [{
            "type": "output", "name": "DP-1", "nodes": [
                {
                    "type": "workspace", "name": "1",
                    "nodes": [{
                        "type": "con", "name": "~/src", "app_id": "foot", "pid": 100,
                        "focused": true, "visible": true,
                        "rect": {"x": 0, "y": 0, "width": 1920, "height": 1080}
                    }],
                    "floating_nodes": [{
                        "type": "floating_con", "name": "Save As", "app_id": null, "pid": 200,
                        "window_properties": {"class": "Gimp"},
                        "focused": false, "visible": true,
                        "rect": {"x": 600, "y": 300, "width": 700, "height": 500}
                    }]
                },
                {
                    "type": "workspace", "name": "2",
                    "nodes": [{
                        "type": "con", "name": "Mozilla Firefox", "app_id": "firefox", "pid": 300,
                        "focused": false, "visible": false,
                        "rect": {"x": 0, "y": 0, "width": 1920, "height": 1080}
                    }]
                }
            ]
        }]
    })");
}

} // namespace

TEST_CASE("WindowInfo", "[window]") {

    SECTION("DefaultIsEmpty") {
        WindowInfo info;
        REQUIRE(info.empty());
        REQUIRE(info.app().empty());
    }

    SECTION("AppPrefersAppId") {
        WindowInfo info{.app_id = "kitty", .window_class = "Kitty"};
        REQUIRE(info.app() == "kitty");
    }

    SECTION("AppFallsBackToClass") {
        WindowInfo info{.window_class = "Firefox"};
        REQUIRE_FALSE(info.empty());
        REQUIRE(info.app() == "Firefox");
    }

    SECTION("WithPidNotEmpty") {
        WindowInfo info;
        info.pid = 1234;
        REQUIRE_FALSE(info.empty());
    }
}

TEST_CASE("SwayWindowManager::collect_windows", "[sway]") {
    auto windows = SwayWindowManager::collect_windows(sample_tree());

    SECTION("FindsEveryClient") {
        REQUIRE(windows.size() == 3);
    }

    SECTION("FocusedThenVisibleThenHidden") {
        REQUIRE(windows[0].title == "~/src");
        REQUIRE(windows[0].focused);
        REQUIRE(windows[1].title == "Save As");
        REQUIRE(windows[2].title == "Mozilla Firefox");
        REQUIRE_FALSE(windows[2].visible);
    }

    SECTION("Fields") {
        auto& term = windows[0];
        REQUIRE(term.app_id == "foot");
        REQUIRE(term.pid == 100);
        REQUIRE(term.workspace == "1");
        REQUIRE(term.rect.width == 1920);
        REQUIRE_FALSE(term.floating);

        auto& dialog = windows[1];
        REQUIRE(dialog.app_id.empty());
        REQUIRE(dialog.window_class == "Gimp");
        REQUIRE(dialog.floating);
        REQUIRE(dialog.rect.x == 600);

        REQUIRE(windows[2].workspace == "2");
    }

    SECTION("ContainersWithoutClientsSkipped") {
        auto tree = json::parse(R"({"type": "root", "nodes": [
            {"type": "workspace", "name": "3", "nodes": [{"type": "con", "name": "split", "nodes": []}]}
        ]})");
        REQUIRE(SwayWindowManager::collect_windows(tree).empty());
    }

    SECTION("MissingRectFields") {
        auto tree = json::parse(R"({"type": "con", "name": "x", "pid": 5, "rect": {"x": null}})");
        auto w = SwayWindowManager::collect_windows(tree);
        REQUIRE(w.size() == 1);
        REQUIRE(w[0].rect.x == 0);
    }
}

TEST_CASE("SwayWindowManager outputs", "[sway]") {
    auto outputs = SwayWindowManager::parse_outputs(json::parse(R"([
        {"name": "HDMI-A-1", "active": true, "focused": false, "scale": 1.0,
         "rect": {"x": 2560, "y": 0, "width": 1920, "height": 1080}},
        {"name": "eDP-1", "active": true, "focused": true, "scale": 2.0,
         "rect": {"x": 0, "y": 0, "width": 1280, "height": 800}},
        {"name": "DP-2", "active": false, "scale": -1,
         "rect": {"x": 0, "y": 0, "width": 0, "height": 0}}
    ])"));

    SECTION("Parse") {
        REQUIRE(outputs.size() == 3);
        REQUIRE(outputs[1].name == "eDP-1");
        REQUIRE(outputs[1].scale == 2.0);
        REQUIRE(outputs[1].focused);
        REQUIRE(outputs[0].rect.x == 2560);
        // Disabled outputs report a nonsense scale
        REQUIRE(outputs[2].scale == 1.0);
    }

    SECTION("NotAnArray") {
        REQUIRE(SwayWindowManager::parse_outputs(json::object()).empty());
    }

    SECTION("SelectByName") {
        auto o = select_output(outputs, "HDMI-A-1");
        REQUIRE(o.has_value());
        REQUIRE(o->rect.x == 2560);
        REQUIRE_FALSE(select_output(outputs, "VGA-1").has_value());
    }

    SECTION("DefaultIsActiveAtOrigin") {
        auto o = select_output(outputs, "");
        REQUIRE(o.has_value());
        REQUIRE(o->name == "eDP-1");
    }

    SECTION("DefaultFallsBackToFirstActive") {
        std::vector<OutputInfo> shifted = {
            {.name = "DP-2", .active = false},
            {.name = "DP-3", .rect = {100, 0, 1920, 1080}, .active = true},
        };
        REQUIRE(select_output(shifted, "")->name == "DP-3");
    }

    SECTION("NoActiveOutputs") {
        REQUIRE_FALSE(select_output({}, "").has_value());
    }
}
