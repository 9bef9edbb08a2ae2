#include <catch2/catch_test_macros.hpp>

#include "action_executor.hpp"
#include "agent_loop.hpp"
#include "inference/inference_client.hpp"
#include "mocks.hpp"
#include "stability_gate.hpp"

#include <chrono>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

// Everything an AgentLoop needs, wired to mocks with all delays zeroed.
struct Harness {
    MockScreenCapture capture;
    MockInputInjector input;
    FakeTransport transport;
    RecordingSink sink;
    MockWindowManager windows;

    InferenceClient inference{transport, {.system_prompt = "sys", .backoff_unit = 1ms}};
    ActionExecutor executor{input, {
        .screen_width = 1920,
        .screen_height = 1080,
        .action_delay = 0ms,
        .pause_before_action = 0ms,
        .focus_delay = 0ms,
        .launch_settle = 0ms,
    }};
    StabilityGate stability{capture, {.max_wait = 0ms}};
    AgentLoop loop;

    explicit Harness(int max_iterations = 10, bool with_windows = false,
                     std::chrono::milliseconds idle_delay = 10s)
        : loop(capture, inference, executor, stability, with_windows ? &windows : nullptr, sink, {
              .max_iterations = max_iterations,
              .stability_enabled = false,
              .settle = 0ms,
              .pause_poll = 1ms,
              .idle_delay = idle_delay,
          }) {}
};

std::string click_on(const std::string& target, int x, int y, double confidence = 0.95) {
    return "<observation>A dialog is open.</observation>\n<reasoning>Press the button.</reasoning>\n"
           "```json\n{\"action\": \"CLICK\", \"x\": " + std::to_string(x) + ", \"y\": " + std::to_string(y) +
           ", \"target\": \"" + target + "\", \"confidence\": " + std::to_string(confidence) + "}\n```";
}

const std::string DONE = "```json\n{\"task_complete\": true}\n```";

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("AgentLoop", "[agent]") {

    SECTION("ClickThenComplete") {
        Harness h;
        h.transport.reply_content(click_on("OK button", 500, 500));
        h.transport.reply_content(DONE);

        auto result = h.loop.run_task("Press OK");

        REQUIRE(result.success);
        REQUIRE(result.message == "Complete");
        REQUIRE(result.steps_taken == 2);
        REQUIRE_FALSE(result.error.has_value());

        auto calls = h.input.calls();
        REQUIRE(calls.size() == 1);
        REQUIRE(calls[0] == "click 960,540 left x1");

        REQUIRE(h.sink.actions.size() == 1);
        REQUIRE(h.sink.actions[0].first == ActionKind::Click);
        REQUIRE(h.sink.actions[0].second == "OK button");
        REQUIRE(h.sink.saw_status(AgentStatus::Running));
        REQUIRE(h.sink.statuses.back().first == AgentStatus::Done);
        REQUIRE_FALSE(h.loop.running());
    }

    SECTION("FramesAreDownscaledForTheModel") {
        Harness h;
        h.transport.reply_content(DONE);
        h.loop.run_task("look");

        REQUIRE(h.sink.frames.size() == 1);
        REQUIRE(h.sink.frames[0].width == 1080);
        REQUIRE(h.sink.frames[0].height == 607);

        auto body = nlohmann::json::parse(h.transport.posts[0].body);
        auto& image = body["messages"][1]["content"][0];
        REQUIRE(image["type"] == "image_url");
        REQUIRE(image["image_url"]["url"].get<std::string>().starts_with("data:image/bmp;base64,Qk"));
    }

    SECTION("PromptCarriesScreenAndStep") {
        Harness h(5);
        h.transport.reply_content(DONE);
        h.loop.run_task("open the settings");

        auto prompt = h.transport.prompt(0);
        REQUIRE(contains(prompt, "TASK: open the settings"));
        REQUIRE(contains(prompt, "Screen: 1080x607"));
        REQUIRE(contains(prompt, "Step: 1/5"));
    }

    SECTION("WindowContextInPrompt") {
        Harness h(10, true);
        WindowInfo editor{.app_id = "org.gnome.TextEditor", .title = "notes.txt", .pid = 42,
                          .rect = {0, 0, 960, 1080}, .focused = true, .visible = true};
        h.windows.windows = {editor};
        h.transport.reply_content(DONE);
        h.loop.run_task("save the file");

        auto prompt = h.transport.prompt(0);
        REQUIRE(contains(prompt, "Foreground Window: 'notes.txt'"));
        REQUIRE(contains(prompt, "1. 'notes.txt' (ACTIVE) [org.gnome.TextEditor]"));
    }

    SECTION("RepeatedActionForcesStrategyChange") {
        Harness h;
        h.transport.reply_content(click_on("Submit", 500, 500));
        h.transport.reply_content(click_on("Submit", 500, 500));
        h.transport.reply_content(DONE);

        auto result = h.loop.run_task("Submit the form");
        REQUIRE(result.success);
        REQUIRE(result.steps_taken == 3);

        REQUIRE_FALSE(contains(h.transport.prompt(1), "Do NOT repeat"));
        auto third = h.transport.prompt(2);
        REQUIRE(contains(third, "Do NOT repeat"));
        REQUIRE(contains(third, "'CLICK on Submit' tried 2 times"));
        REQUIRE(contains(third, "- CLICK: Submit at (960, 540) -> executed"));
    }

    SECTION("AbortDuringRequest") {
        Harness h;
        h.transport.on_post = [&h] { h.loop.abort(); };
        h.transport.reply_content(click_on("OK", 500, 500));

        auto result = h.loop.run_task("anything");

        REQUIRE_FALSE(result.success);
        REQUIRE(result.message == "Aborted");
        REQUIRE(result.steps_taken == 0);
        REQUIRE(h.input.calls().empty());
        REQUIRE(h.sink.statuses.back().first == AgentStatus::Aborted);
        // Interrupts do not leak into the next task
        REQUIRE_FALSE(h.loop.abort_requested());
    }

    SECTION("AbortWhilePaused") {
        Harness h;
        h.loop.pause();
        std::jthread aborter([&h] {
            std::this_thread::sleep_for(20ms);
            h.loop.abort();
        });

        auto result = h.loop.run_task("anything");
        REQUIRE(result.message == "Aborted");
        REQUIRE(h.sink.saw_status(AgentStatus::Paused));
        REQUIRE(h.transport.post_count() == 0);
        REQUIRE_FALSE(h.loop.paused());
    }

    SECTION("PauseThenResume") {
        Harness h;
        h.transport.reply_content(DONE);
        h.loop.pause();
        std::jthread resumer([&h] {
            std::this_thread::sleep_for(20ms);
            h.loop.resume();
        });

        auto result = h.loop.run_task("anything");
        REQUIRE(result.success);

        bool resumed = false;
        for (auto& [status, detail] : h.sink.statuses) {
            if (status == AgentStatus::Running && detail == "Resumed") resumed = true;
        }
        REQUIRE(h.sink.saw_status(AgentStatus::Paused));
        REQUIRE(resumed);
    }

    SECTION("SkipConsumesOneIteration") {
        Harness h(3);
        h.transport.reply_content(DONE);
        h.loop.skip_step();

        auto result = h.loop.run_task("anything");
        REQUIRE(result.success);
        REQUIRE(result.steps_taken == 2);
        REQUIRE(h.transport.post_count() == 1);
        REQUIRE(contains(h.transport.prompt(0), "Step: 2/3"));
    }

    SECTION("SteeringReachesNextPrompt") {
        Harness h;
        h.transport.reply_content(DONE);
        REQUIRE(h.loop.inject_context("use the File menu"));

        h.loop.run_task("save");
        REQUIRE(contains(h.transport.prompt(0), "User: use the File menu"));
        REQUIRE(h.sink.thoughts.front() == "Heard: use the File menu");
    }

    SECTION("MaxStepsReached") {
        Harness h(3);
        for (int i = 0; i < 3; i++) {
            h.transport.reply_content("{\"action\": \"WAIT\", \"duration\": 0, \"target\": \"page\"}");
        }

        auto result = h.loop.run_task("wait forever");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.message == "Max steps reached");
        REQUIRE(result.steps_taken == 3);
        REQUIRE(result.error == std::optional<std::string>("Max steps reached"));
        REQUIRE(h.sink.statuses.back().first == AgentStatus::Error);
    }

    SECTION("CaptureFailureIsReportedNextStep") {
        Harness h;
        h.capture.fail_next(1);
        h.transport.reply_content(DONE);

        auto result = h.loop.run_task("anything");
        REQUIRE(result.success);
        REQUIRE(result.steps_taken == 2);
        REQUIRE(contains(h.transport.prompt(0), "Previous issue: Screen capture failed"));
    }

    SECTION("ProseWithoutJsonIsReported") {
        Harness h;
        h.transport.reply_content("<observation>I see a desktop.</observation> I am not sure what to do.");
        h.transport.reply_content(DONE);

        auto result = h.loop.run_task("anything");
        REQUIRE(result.success);
        REQUIRE(h.sink.thoughts.front() == "I see a desktop.");
        REQUIRE(contains(h.transport.prompt(1), "Previous issue: Model did not return valid JSON for an action."));
    }

    SECTION("InvalidActionIsReported") {
        Harness h;
        h.transport.reply_content("{\"action\": \"DANCE\"}");
        h.transport.reply_content(DONE);

        h.loop.run_task("anything");
        REQUIRE(contains(h.transport.prompt(1), "Previous issue: Invalid action type: 'DANCE'"));
    }

    SECTION("ServerErrorIsRetriedThenReported") {
        Harness h;
        for (int i = 0; i < 3; i++) h.transport.reply(HttpResponse{503, "loading model"});
        h.transport.reply_content(DONE);

        auto result = h.loop.run_task("anything");
        REQUIRE(result.success);
        REQUIRE(h.transport.post_count() == 4);
        REQUIRE(contains(h.transport.prompt(3), "Previous issue: API error 503: loading model"));
    }

    SECTION("LowConfidenceIsSkipped") {
        Harness h;
        h.transport.reply_content(click_on("Delete", 500, 500, 0.3));
        h.transport.reply_content(DONE);

        auto result = h.loop.run_task("anything");
        REQUIRE(result.success);
        REQUIRE(h.input.calls().empty());
        REQUIRE(contains(h.transport.prompt(1), "-> skipped"));
    }

    SECTION("FailsafeAbortsTask") {
        Harness h;
        h.input.pointer = coords::Point{0, 0};
        h.transport.reply_content(click_on("OK", 500, 500));

        auto result = h.loop.run_task("anything");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.message == "Aborted");
        REQUIRE(result.error == std::optional<std::string>("Failsafe triggered"));
        REQUIRE(h.input.calls().empty());
    }

    SECTION("CalibrationOffsetApplied") {
        MockScreenCapture capture;
        MockInputInjector input;
        FakeTransport transport;
        RecordingSink sink;
        InferenceClient inference{transport, {.backoff_unit = 1ms}};
        ActionExecutor executor{input, {.action_delay = 0ms, .pause_before_action = 0ms}};
        StabilityGate stability{capture, {}};
        AgentLoop loop(capture, inference, executor, stability, nullptr, sink, {
            .offset = {5, -3},
            .stability_enabled = false,
            .settle = 0ms,
            .idle_delay = 5ms,
        });

        transport.reply_content(click_on("OK", 500, 500));
        transport.reply_content(DONE);
        loop.run_task("anything");

        REQUIRE(input.calls() == std::vector<std::string>{"click 965,537 left x1"});
    }

    SECTION("IdleAfterFinish") {
        Harness h(10, false, 5ms);
        h.transport.reply_content(DONE);
        h.loop.run_task("anything");

        std::this_thread::sleep_for(50ms);
        REQUIRE(h.sink.statuses.back().first == AgentStatus::Idle);
    }
}

TEST_CASE("AgentLoop thought extraction", "[agent]") {

    SECTION("ObservationAndReasoning") {
        auto t = AgentLoop::extract_thought("<observation> A login form </observation>"
                                            "<reasoning>Type the user name</reasoning>");
        REQUIRE(t == "A login form\nType the user name");
    }

    SECTION("ReasoningOnlyGetsLongerBudget") {
        std::string reasoning(300, 'r');
        auto t = AgentLoop::extract_thought("<reasoning>" + reasoning + "</reasoning>");
        REQUIRE(t == std::string(200, 'r') + "...");
    }

    SECTION("ObservationTruncated") {
        std::string observation(200, 'o');
        auto t = AgentLoop::extract_thought("<observation>" + observation + "</observation>");
        REQUIRE(t == std::string(150, 'o') + "...");
    }

    SECTION("VeryLongReply") {
        std::string observation(100 * 1024, 'o');
        auto t = AgentLoop::extract_thought("<observation>\n" + observation + "\n</observation>"
                                            "<reasoning>" + std::string(100 * 1024, 'r') + "</reasoning>");
        REQUIRE(t == std::string(150, 'o') + "...\n" + std::string(100, 'r') + "...");
    }

    SECTION("UnclosedOrEmptyTags") {
        REQUIRE(AgentLoop::extract_thought("<observation>never closed").empty());
        REQUIRE(AgentLoop::extract_thought("<reasoning>  \n </reasoning>").empty());
    }

    SECTION("NoTags") {
        REQUIRE(AgentLoop::extract_thought("{\"action\": \"WAIT\"}").empty());
    }
}
