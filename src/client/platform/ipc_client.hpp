#pragma once

#include <nlohmann/json.hpp>
#include <string>

// Client side of the daemon's newline-delimited JSON control socket.
class IpcClient {
public:
    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    // One command per line.
    virtual bool send(const nlohmann::json& cmd) = 0;
    // Next reply or event. A negative timeout waits until the daemon answers
    // or hangs up, which is how `run` and `watch` block.
    virtual bool recv(nlohmann::json& message, int timeout_ms = 30000) = 0;
    virtual void close() = 0;
};
