#pragma once

#include "action.hpp"
#include "action_history.hpp"
#include "platform/input_injector.hpp"

#include <chrono>
#include <expected>
#include <string>

struct ActionError {
    enum class Kind {
        InvalidAction,       // payload does not fit the kind
        MissingCoordinates,  // pointer action without a point
        InputFailed,         // the input backend reported an error
        Failsafe,            // operator parked the pointer in a corner
    };

    Kind kind = Kind::InvalidAction;
    std::string message;
};

// Validates one resolved ActionIntent and drives the input backend.
// Every attempt, including skipped ones, lands in history().
class ActionExecutor {
public:
    struct Options {
        int screen_width = 0;
        int screen_height = 0;
        double confidence_threshold = 0.8;
        std::chrono::milliseconds action_delay{500};
        std::chrono::milliseconds pause_before_action{100};
        std::chrono::milliseconds focus_delay{150};    // between click-to-focus and typing
        std::chrono::milliseconds launch_settle{1000}; // after LAUNCH_APP / OPEN_URL
        double max_duration_s = 10.0;                  // cap on WAIT and DRAG durations
        bool failsafe = true;
    };

    ActionExecutor(InputInjector& input, Options options);

    ActionExecutor(const ActionExecutor&) = delete;
    ActionExecutor& operator=(const ActionExecutor&) = delete;

    // true = dispatched, false = skipped (low confidence, empty payload).
    std::expected<bool, ActionError> execute(const ActionIntent& intent);

    void set_screen_size(int width, int height);

    ActionHistory& history() { return history_; }
    const ActionHistory& history() const { return history_; }
    const Options& options() const { return options_; }

private:
    std::expected<bool, ActionError> dispatch(const ActionIntent& intent, ActionRecord& record);
    coords::Point checked(coords::Point p, ActionRecord& record);
    double bounded_duration(ActionKind kind, double seconds) const;
    bool failsafe_tripped();
    void post_action_delay();

    InputInjector& input_;
    Options options_;
    ActionHistory history_;
};
