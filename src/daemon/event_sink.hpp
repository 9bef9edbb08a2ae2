#pragma once

#include "action.hpp"

#include <string>

enum class AgentStatus { Idle, Running, Paused, Done, Aborted, Error };

inline const char* to_string(AgentStatus status) {
    switch (status) {
        case AgentStatus::Idle: return "idle";
        case AgentStatus::Running: return "running";
        case AgentStatus::Paused: return "paused";
        case AgentStatus::Done: return "done";
        case AgentStatus::Aborted: return "aborted";
        case AgentStatus::Error: return "error";
    }
    return "unknown";
}

// One-way notifications out of the agent loop. Implementations must not block
// and may be called from the agent thread and its idle timer.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void on_status(AgentStatus status, const std::string& detail) = 0;
    virtual void on_thought(const std::string& text) = 0;
    virtual void on_action(ActionKind kind, const std::string& target) = 0;
    virtual void on_frame(int width, int height, const std::string& image_base64) = 0;
};
