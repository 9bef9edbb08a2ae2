#include "action.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <utility>

using json = nlohmann::json;

namespace {

constexpr std::array<std::pair<ActionKind, const char*>, 21> KIND_NAMES = {{
    {ActionKind::Click, "CLICK"},
    {ActionKind::DoubleClick, "DOUBLE_CLICK"},
    {ActionKind::RightClick, "RIGHT_CLICK"},
    {ActionKind::TripleClick, "TRIPLE_CLICK"},
    {ActionKind::Move, "MOVE"},
    {ActionKind::Drag, "DRAG"},
    {ActionKind::Scroll, "SCROLL"},
    {ActionKind::Type, "TYPE"},
    {ActionKind::Press, "PRESS"},
    {ActionKind::Hotkey, "HOTKEY"},
    {ActionKind::Copy, "COPY"},
    {ActionKind::Paste, "PASTE"},
    {ActionKind::Cut, "CUT"},
    {ActionKind::SelectAll, "SELECT_ALL"},
    {ActionKind::FocusWindow, "FOCUS_WINDOW"},
    {ActionKind::Minimize, "MINIMIZE"},
    {ActionKind::Maximize, "MAXIMIZE"},
    {ActionKind::CloseWindow, "CLOSE_WINDOW"},
    {ActionKind::LaunchApp, "LAUNCH_APP"},
    {ActionKind::OpenUrl, "OPEN_URL"},
    {ActionKind::Wait, "WAIT"},
}};

std::optional<double> number_field(const json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key)) return std::nullopt;
    const auto& v = obj[key];
    if (v.is_number()) return v.get<double>();
    return std::nullopt;
}

std::string string_field(const json& data, const char* key) {
    if (data.contains(key) && data[key].is_string()) return data[key].get<std::string>();
    return {};
}

std::optional<coords::Point> point_from(std::optional<double> x, std::optional<double> y) {
    if (!x || !y) return std::nullopt;
    return coords::Point{static_cast<int>(std::lround(*x)), static_cast<int>(std::lround(*y))};
}

// x/y at the top level, then "coordinates", then the center of "bbox_2d".
std::optional<coords::Point> start_point(const json& data) {
    auto p = point_from(number_field(data, "x"), number_field(data, "y"));
    if (p) return p;

    if (data.contains("coordinates")) {
        const auto& c = data["coordinates"];
        if (c.is_object()) {
            p = point_from(number_field(c, "x"), number_field(c, "y"));
        } else if (c.is_array() && c.size() >= 2 && c[0].is_number() && c[1].is_number()) {
            p = point_from(c[0].get<double>(), c[1].get<double>());
        }
        if (p) return p;
    }

    if (data.contains("bbox_2d")) {
        const auto& b = data["bbox_2d"];
        if (b.is_array() && b.size() == 4
            && std::ranges::all_of(b, [](const json& v) { return v.is_number(); })) {
            coords::BoundingBox box{b[0].get<int>(), b[1].get<int>(), b[2].get<int>(), b[3].get<int>()};
            return box.center();
        }
    }
    return std::nullopt;
}

std::optional<coords::Point> end_point(const json& data) {
    auto p = point_from(number_field(data, "end_x"), number_field(data, "end_y"));
    if (p) return p;
    if (data.contains("end_coordinates")) {
        return point_from(number_field(data["end_coordinates"], "x"),
                          number_field(data["end_coordinates"], "y"));
    }
    return std::nullopt;
}

// "value", "text", "url", "app_name", first non-empty wins.
std::string text_payload(const json& data) {
    for (const char* key : {"value", "text", "url", "app_name"}) {
        auto s = string_field(data, key);
        if (!s.empty()) return s;
    }
    return {};
}

std::vector<std::string> chord_keys(const json& data) {
    std::vector<std::string> keys;
    if (!data.contains("keys")) return keys;

    const auto& k = data["keys"];
    if (k.is_array()) {
        for (const auto& v : k) {
            if (v.is_string()) keys.push_back(v.get<std::string>());
        }
    } else if (k.is_string()) {
        // "ctrl+shift+t"
        std::string s = k.get<std::string>();
        size_t start = 0;
        while (start <= s.size()) {
            auto plus = s.find('+', start);
            if (plus == std::string::npos) plus = s.size();
            if (plus > start) keys.push_back(s.substr(start, plus - start));
            start = plus + 1;
        }
    }
    return keys;
}

} // namespace

const char* to_string(ActionKind kind) {
    for (auto& [k, name] : KIND_NAMES) {
        if (k == kind) return name;
    }
    return "UNKNOWN";
}

std::optional<ActionKind> parse_action_kind(std::string_view name) {
    std::string upper(name);
    std::ranges::transform(upper, upper.begin(), [](unsigned char c) { return std::toupper(c); });
    for (auto& [k, n] : KIND_NAMES) {
        if (upper == n) return k;
    }
    return std::nullopt;
}

bool requires_coordinates(ActionKind kind) {
    switch (kind) {
        case ActionKind::Click:
        case ActionKind::DoubleClick:
        case ActionKind::RightClick:
        case ActionKind::TripleClick:
        case ActionKind::Move:
        case ActionKind::Drag:
            return true;
        default:
            return false;
    }
}

std::optional<coords::Point> ActionIntent::primary_point() const {
    if (auto* p = std::get_if<PointerPayload>(&payload)) return p->at;
    if (auto* p = std::get_if<DragPayload>(&payload)) return p->from;
    if (auto* p = std::get_if<ScrollPayload>(&payload)) return p->at;
    if (auto* p = std::get_if<TypePayload>(&payload)) return p->focus_at;
    return std::nullopt;
}

std::expected<ActionIntent, std::string> decode_action(const json& data) {
    if (!data.is_object()) {
        return std::unexpected("action is not a JSON object");
    }

    auto name = string_field(data, "action");
    auto kind = parse_action_kind(name);
    if (!kind) {
        return std::unexpected("Invalid action type: '" + name + "'");
    }

    ActionIntent intent;
    intent.kind = *kind;
    intent.target = string_field(data, "target");
    intent.thought = string_field(data, "thought");
    intent.confidence = number_field(data, "confidence").value_or(1.0);

    auto at = start_point(data);
    auto missing_coordinates = [&]() {
        return std::unexpected(std::string("Model did not provide coordinates for ") + to_string(*kind)
                               + " on '" + (intent.target.empty() ? "unknown element" : intent.target) + "'");
    };

    double duration = number_field(data, "duration").value_or(0.5);

    switch (*kind) {
        case ActionKind::Click:
        case ActionKind::DoubleClick:
        case ActionKind::RightClick:
        case ActionKind::TripleClick:
        case ActionKind::Move:
            if (!at) return missing_coordinates();
            intent.payload = PointerPayload{*at};
            break;

        case ActionKind::Drag: {
            auto to = end_point(data);
            if (!at || !to) return missing_coordinates();
            intent.payload = DragPayload{*at, *to, duration};
            break;
        }

        case ActionKind::Scroll: {
            auto amount = number_field(data, "scroll");
            if (!amount) amount = number_field(data, "scroll_amount");
            intent.payload = ScrollPayload{static_cast<int>(std::lround(amount.value_or(0))), at};
            break;
        }

        case ActionKind::Type:
            intent.payload = TypePayload{text_payload(data), at};
            break;

        case ActionKind::Press:
            intent.payload = KeyPayload{string_field(data, "key")};
            break;

        case ActionKind::Hotkey:
            intent.payload = ChordPayload{chord_keys(data)};
            break;

        case ActionKind::Copy:
        case ActionKind::Paste:
        case ActionKind::Cut:
        case ActionKind::SelectAll:
            intent.payload = NoPayload{};
            break;

        case ActionKind::FocusWindow: {
            auto title = text_payload(data);
            intent.payload = WindowPayload{title.empty() ? intent.target : title};
            break;
        }

        case ActionKind::Minimize:
        case ActionKind::Maximize:
        case ActionKind::CloseWindow:
            intent.payload = WindowPayload{text_payload(data)};
            break;

        case ActionKind::LaunchApp: {
            auto app = text_payload(data);
            intent.payload = LaunchPayload{app.empty() ? intent.target : app};
            break;
        }

        case ActionKind::OpenUrl:
            intent.payload = UrlPayload{text_payload(data)};
            break;

        case ActionKind::Wait:
            intent.payload = WaitPayload{duration};
            break;
    }

    return intent;
}

ActionIntent resolve_coordinates(ActionIntent intent, int screen_w, int screen_h,
                                 const coords::CalibrationOffset& offset) {
    if (intent.space == CoordinateSpace::Pixels) return intent;

    auto px = [&](coords::Point p) { return coords::resolve(p.x, p.y, screen_w, screen_h, offset); };

    if (auto* p = std::get_if<PointerPayload>(&intent.payload)) {
        p->at = px(p->at);
    } else if (auto* d = std::get_if<DragPayload>(&intent.payload)) {
        d->from = px(d->from);
        d->to = px(d->to);
    } else if (auto* s = std::get_if<ScrollPayload>(&intent.payload)) {
        if (s->at) s->at = px(*s->at);
    } else if (auto* t = std::get_if<TypePayload>(&intent.payload)) {
        if (t->focus_at) t->focus_at = px(*t->focus_at);
    }

    intent.space = CoordinateSpace::Pixels;
    return intent;
}
