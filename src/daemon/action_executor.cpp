#include "action_executor.hpp"

#include <format>
#include <print>
#include <thread>

namespace {

std::expected<bool, ActionError> input_failed(const std::string& what, const std::string& why) {
    return std::unexpected(ActionError{ActionError::Kind::InputFailed, what + " failed: " + why});
}

std::expected<bool, ActionError> invalid(ActionKind kind) {
    return std::unexpected(ActionError{ActionError::Kind::InvalidAction,
                                       std::string("payload does not match action ") + to_string(kind)});
}

} // namespace

ActionExecutor::ActionExecutor(InputInjector& input, Options options)
    : input_(input), options_(options) {}

void ActionExecutor::set_screen_size(int width, int height) {
    options_.screen_width = width;
    options_.screen_height = height;
}

std::expected<bool, ActionError> ActionExecutor::execute(const ActionIntent& intent) {
    ActionRecord record{
        .kind = intent.kind,
        .target = intent.target,
        .at = intent.primary_point(),
    };

    if (intent.confidence < options_.confidence_threshold) {
        std::println(stderr, "executor: skipping {} on '{}', confidence {:.2f} < {:.2f}",
                     to_string(intent.kind), intent.target, intent.confidence,
                     options_.confidence_threshold);
        record.outcome = ActionOutcome::Skipped;
        record.detail = std::format("confidence {:.2f}", intent.confidence);
        history_.push(std::move(record));
        return false;
    }

    if (intent.space != CoordinateSpace::Pixels && intent.primary_point()) {
        record.outcome = ActionOutcome::Failed;
        record.detail = "unresolved coordinates";
        history_.push(std::move(record));
        return std::unexpected(ActionError{ActionError::Kind::InvalidAction,
                                           "coordinates were not resolved to pixels"});
    }

    if (failsafe_tripped()) {
        std::println(stderr, "executor: FAILSAFE TRIGGERED, pointer in screen corner");
        record.outcome = ActionOutcome::Failed;
        record.detail = "Failsafe triggered";
        history_.push(std::move(record));
        return std::unexpected(ActionError{ActionError::Kind::Failsafe, "Failsafe triggered"});
    }

    if (options_.pause_before_action.count() > 0) {
        std::this_thread::sleep_for(options_.pause_before_action);
    }

    auto result = dispatch(intent, record);
    if (!result) {
        record.outcome = ActionOutcome::Failed;
        record.detail = result.error().message;
    } else if (!*result) {
        record.outcome = ActionOutcome::Skipped;
    } else {
        record.outcome = ActionOutcome::Executed;
    }
    history_.push(std::move(record));
    return result;
}

std::expected<bool, ActionError> ActionExecutor::dispatch(const ActionIntent& intent, ActionRecord& record) {
    const auto& payload = intent.payload;

    auto pointer = [&]() -> std::optional<coords::Point> {
        auto* p = std::get_if<PointerPayload>(&payload);
        if (!p) return std::nullopt;
        return checked(p->at, record);
    };
    auto missing = [&]() {
        return std::unexpected(ActionError{ActionError::Kind::MissingCoordinates,
                                           std::string(to_string(intent.kind)) + " requires coordinates"});
    };
    auto chord = [&](std::vector<std::string> keys, const char* what) -> std::expected<bool, ActionError> {
        if (auto r = input_.hotkey(keys); !r) return input_failed(what, r.error());
        post_action_delay();
        return true;
    };

    switch (intent.kind) {
        case ActionKind::Click:
        case ActionKind::DoubleClick:
        case ActionKind::RightClick:
        case ActionKind::TripleClick: {
            auto at = pointer();
            if (!at) return missing();
            MouseButton button = intent.kind == ActionKind::RightClick ? MouseButton::Right : MouseButton::Left;
            int count = intent.kind == ActionKind::DoubleClick ? 2 : intent.kind == ActionKind::TripleClick ? 3 : 1;
            if (auto r = input_.click(*at, button, count); !r) return input_failed("click", r.error());
            post_action_delay();
            return true;
        }

        case ActionKind::Move: {
            auto at = pointer();
            if (!at) return missing();
            if (auto r = input_.move(*at); !r) return input_failed("move", r.error());
            return true;
        }

        case ActionKind::Drag: {
            auto* d = std::get_if<DragPayload>(&payload);
            if (!d) return missing();
            auto from = checked(d->from, record);
            auto to = checked(d->to, record);
            auto duration = bounded_duration(intent.kind, d->duration_s);
            if (auto r = input_.drag(from, to, duration); !r) return input_failed("drag", r.error());
            post_action_delay();
            return true;
        }

        case ActionKind::Scroll: {
            auto* s = std::get_if<ScrollPayload>(&payload);
            if (!s) return invalid(intent.kind);
            if (s->amount == 0) {
                std::println(stderr, "executor: scroll amount is zero");
                return false;
            }
            std::optional<coords::Point> at;
            if (s->at) at = checked(*s->at, record);
            if (auto r = input_.scroll(s->amount, at); !r) return input_failed("scroll", r.error());
            post_action_delay();
            return true;
        }

        case ActionKind::Type: {
            auto* t = std::get_if<TypePayload>(&payload);
            if (!t) return invalid(intent.kind);
            if (t->text.empty()) {
                std::println(stderr, "executor: empty text provided to TYPE");
                return false;
            }
            if (t->focus_at) {
                auto at = checked(*t->focus_at, record);
                if (auto r = input_.click(at, MouseButton::Left, 1); !r) return input_failed("click", r.error());
                post_action_delay();
                std::this_thread::sleep_for(options_.focus_delay);
            }
            if (auto r = input_.type_text(t->text); !r) return input_failed("type", r.error());
            post_action_delay();
            return true;
        }

        case ActionKind::Press: {
            auto* k = std::get_if<KeyPayload>(&payload);
            if (!k) return invalid(intent.kind);
            if (k->key.empty()) {
                std::println(stderr, "executor: empty key provided to PRESS");
                return false;
            }
            if (auto r = input_.press(k->key); !r) return input_failed("key press", r.error());
            post_action_delay();
            return true;
        }

        case ActionKind::Hotkey: {
            auto* c = std::get_if<ChordPayload>(&payload);
            if (!c) return invalid(intent.kind);
            if (c->keys.empty()) {
                std::println(stderr, "executor: empty keys provided to HOTKEY");
                return false;
            }
            return chord(c->keys, "hotkey");
        }

        case ActionKind::Copy: return chord({"ctrl", "c"}, "copy");
        case ActionKind::Paste: return chord({"ctrl", "v"}, "paste");
        case ActionKind::Cut: return chord({"ctrl", "x"}, "cut");
        case ActionKind::SelectAll: return chord({"ctrl", "a"}, "select all");

        case ActionKind::FocusWindow:
        case ActionKind::Minimize:
        case ActionKind::Maximize:
        case ActionKind::CloseWindow: {
            auto* w = std::get_if<WindowPayload>(&payload);
            std::string title = w ? w->title : std::string{};
            InputInjector::Result r;
            if (intent.kind == ActionKind::FocusWindow) {
                if (title.empty()) {
                    std::println(stderr, "executor: FOCUS_WINDOW without a window title");
                    return false;
                }
                r = input_.focus_window(title);
            } else if (intent.kind == ActionKind::Minimize) {
                r = input_.minimize_window(title);
            } else if (intent.kind == ActionKind::Maximize) {
                r = input_.maximize_window(title);
            } else {
                r = input_.close_window(title);
            }
            if (!r) return input_failed(to_string(intent.kind), r.error());
            post_action_delay();
            return true;
        }

        case ActionKind::LaunchApp: {
            auto* l = std::get_if<LaunchPayload>(&payload);
            if (!l) return invalid(intent.kind);
            if (l->app.empty()) {
                std::println(stderr, "executor: LAUNCH_APP without an application name");
                return false;
            }
            if (auto r = input_.launch_app(l->app); !r) return input_failed("launch", r.error());
            std::this_thread::sleep_for(options_.launch_settle);
            return true;
        }

        case ActionKind::OpenUrl: {
            auto* u = std::get_if<UrlPayload>(&payload);
            if (!u) return invalid(intent.kind);
            if (u->url.empty()) {
                std::println(stderr, "executor: OPEN_URL without a url");
                return false;
            }
            if (auto r = input_.open_url(u->url); !r) return input_failed("open url", r.error());
            std::this_thread::sleep_for(options_.launch_settle);
            return true;
        }

        case ActionKind::Wait: {
            auto* w = std::get_if<WaitPayload>(&payload);
            double seconds = bounded_duration(intent.kind, w ? w->seconds : 0.0);
            if (seconds > 0) {
                std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
            }
            return true;
        }
    }

    return invalid(intent.kind);
}

coords::Point ActionExecutor::checked(coords::Point p, ActionRecord& record) {
    if (coords::is_within_screen(p, options_.screen_width, options_.screen_height)) return p;

    auto clamped = coords::clamp_to_screen(p, options_.screen_width, options_.screen_height);
    std::println(stderr, "executor: warning: ({}, {}) outside {}x{}, clamped to ({}, {})",
                 p.x, p.y, options_.screen_width, options_.screen_height, clamped.x, clamped.y);
    record.clamped = true;
    if (record.at && *record.at == p) record.at = clamped;
    return clamped;
}

double ActionExecutor::bounded_duration(ActionKind kind, double seconds) const {
    if (!(seconds > 0)) return 0.0;
    if (seconds <= options_.max_duration_s) return seconds;
    std::println(stderr, "executor: warning: {} duration {:g}s capped to {:g}s",
                 to_string(kind), seconds, options_.max_duration_s);
    return options_.max_duration_s;
}

bool ActionExecutor::failsafe_tripped() {
    if (!options_.failsafe) return false;

    auto pos = input_.pointer_position();
    if (!pos) return false;

    int max_x = options_.screen_width - 1;
    int max_y = options_.screen_height - 1;
    bool left = pos->x <= 0, right = pos->x >= max_x;
    bool top = pos->y <= 0, bottom = pos->y >= max_y;
    return (left || right) && (top || bottom);
}

void ActionExecutor::post_action_delay() {
    if (options_.action_delay.count() > 0) {
        std::this_thread::sleep_for(options_.action_delay);
    }
}
