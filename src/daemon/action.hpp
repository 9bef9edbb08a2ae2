#pragma once

#include "coordinate_transform.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

enum class ActionKind {
    // Pointer
    Click,
    DoubleClick,
    RightClick,
    TripleClick,
    Move,
    Drag,
    Scroll,
    // Keyboard
    Type,
    Press,
    Hotkey,
    // Clipboard
    Copy,
    Paste,
    Cut,
    SelectAll,
    // Window management
    FocusWindow,
    Minimize,
    Maximize,
    CloseWindow,
    // Applications
    LaunchApp,
    OpenUrl,
    // Control flow
    Wait,
};

const char* to_string(ActionKind kind);

// Case-insensitive, wire names ("DOUBLE_CLICK").
std::optional<ActionKind> parse_action_kind(std::string_view name);

// Kinds that cannot run without a point.
bool requires_coordinates(ActionKind kind);

struct NoPayload {};

struct PointerPayload {          // click family, MOVE
    coords::Point at;
};

struct DragPayload {
    coords::Point from;
    coords::Point to;
    double duration_s = 0.5;
};

struct ScrollPayload {
    int amount = 0;              // positive = up
    std::optional<coords::Point> at;
};

struct TypePayload {
    std::string text;
    std::optional<coords::Point> focus_at;
};

struct KeyPayload {
    std::string key;
};

struct ChordPayload {
    std::vector<std::string> keys;
};

struct WindowPayload {
    std::string title;           // empty = focused window
};

struct LaunchPayload {
    std::string app;
};

struct UrlPayload {
    std::string url;
};

struct WaitPayload {
    double seconds = 0.5;
};

using ActionPayload = std::variant<NoPayload, PointerPayload, DragPayload, ScrollPayload,
                                   TypePayload, KeyPayload, ChordPayload, WindowPayload,
                                   LaunchPayload, UrlPayload, WaitPayload>;

enum class CoordinateSpace { Normalized, Pixels };

struct ActionIntent {
    ActionKind kind = ActionKind::Wait;
    ActionPayload payload;
    std::string target;
    double confidence = 1.0;
    std::string thought;
    CoordinateSpace space = CoordinateSpace::Normalized;

    // The point the action acts on first, if it has one.
    std::optional<coords::Point> primary_point() const;
};

// Decodes one model action object. Fails on unknown kinds and on pointer
// kinds without coordinates; other fields fall back to defaults.
std::expected<ActionIntent, std::string> decode_action(const nlohmann::json& data);

// Normalized -> pixel space plus the calibration offset. No clamping here.
ActionIntent resolve_coordinates(ActionIntent intent, int screen_w, int screen_h,
                                 const coords::CalibrationOffset& offset);
