#include <catch2/catch_test_macros.hpp>

#include "action_history.hpp"

namespace {

ActionRecord record(ActionKind kind, std::string target, ActionOutcome outcome = ActionOutcome::Executed) {
    return ActionRecord{.kind = kind, .target = std::move(target), .outcome = outcome};
}

} // namespace

TEST_CASE("ActionHistory", "[history]") {

    SECTION("Describe") {
        ActionRecord r{.kind = ActionKind::Click, .target = "OK button", .at = coords::Point{960, 540}};
        REQUIRE(r.describe() == "CLICK: OK button at (960, 540) -> executed");

        ActionRecord skipped{.kind = ActionKind::Type, .outcome = ActionOutcome::Skipped, .detail = "confidence 0.40"};
        REQUIRE(skipped.describe() == "TYPE: unknown -> skipped: confidence 0.40");
    }

    SECTION("DescribeTruncatesDetail") {
        ActionRecord r{.kind = ActionKind::Press, .target = "k", .outcome = ActionOutcome::Failed,
                       .detail = std::string(80, 'x')};
        REQUIRE(r.describe() == "PRESS: k -> failed: " + std::string(50, 'x'));
    }

    SECTION("CapacityEvictsOldest") {
        ActionHistory h(3);
        for (int i = 0; i < 5; i++) {
            h.push(record(ActionKind::Click, "t" + std::to_string(i)));
        }
        REQUIRE(h.size() == 3);
        REQUIRE(h.records().front().target == "t2");
        REQUIRE(h.last()->target == "t4");
    }

    SECTION("ZeroCapacityKeepsNothing") {
        ActionHistory h(0);
        h.push(record(ActionKind::Click, "a"));
        REQUIRE(h.empty());
        REQUIRE(h.last() == nullptr);
    }

    SECTION("TraceLastN") {
        ActionHistory h;
        h.push(record(ActionKind::Click, "a"));
        h.push(record(ActionKind::Type, "b"));
        h.push(record(ActionKind::Scroll, "c"));
        REQUIRE(h.trace(2) == "- TYPE: b -> executed\n- SCROLL: c -> executed");
        REQUIRE(h.trace(10).starts_with("- CLICK: a"));
        REQUIRE(ActionHistory().trace(5).empty());
    }

    SECTION("TrailingRepeats") {
        ActionHistory h;
        h.push(record(ActionKind::Click, "Submit"));
        h.push(record(ActionKind::Type, "Name"));
        h.push(record(ActionKind::Click, "Submit"));
        h.push(record(ActionKind::Click, "Submit", ActionOutcome::Failed));

        REQUIRE(h.trailing_repeats(record(ActionKind::Click, "Submit")) == 2);
        REQUIRE(h.trailing_repeats(record(ActionKind::Click, "Cancel")) == 0);
        REQUIRE(h.trailing_repeats(record(ActionKind::DoubleClick, "Submit")) == 0);
    }

    SECTION("Clear") {
        ActionHistory h;
        h.push(record(ActionKind::Wait, ""));
        h.clear();
        REQUIRE(h.empty());
    }
}
