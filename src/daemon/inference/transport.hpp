#pragma once

#include <chrono>
#include <expected>
#include <string>

struct HttpResponse {
    long status = 0;
    std::string body;
};

struct TransportError {
    enum class Kind { Timeout, Connection, Other };
    Kind kind = Kind::Other;
    std::string message;
};

// Blocking HTTP used by the inference client. Implementations may keep a
// persistent connection but are never shared between threads.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual std::expected<HttpResponse, TransportError>
        get(const std::string& url, std::chrono::milliseconds timeout) = 0;
    virtual std::expected<HttpResponse, TransportError>
        post_json(const std::string& url, const std::string& body, std::chrono::milliseconds timeout) = 0;
};
