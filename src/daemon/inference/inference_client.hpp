#pragma once

#include "transport.hpp"

#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

enum class InferenceErrorKind {
    None,
    Aborted,
    Timeout,
    Connection,
    Http,       // non-2xx status
    Network,    // any other transport failure
    Decode,     // body is not JSON
    Format,     // JSON without choices[0].message.content
};

struct InferenceResponse {
    std::string raw_text;
    std::optional<nlohmann::json> parsed;
    bool success = false;
    std::optional<std::string> error;
    InferenceErrorKind error_kind = InferenceErrorKind::None;
};

// Chat-completion client for the vision model server. Owned by the agent thread.
class InferenceClient {
public:
    struct Options {
        std::string base_url = "http://127.0.0.1:8080";
        std::string model = "qwen3-vl";
        std::string system_prompt;
        std::string image_mime = "image/bmp";
        double temperature = 0.7;
        double top_p = 0.8;
        std::chrono::milliseconds timeout{120'000};
        std::chrono::milliseconds health_timeout{10'000};
        std::chrono::milliseconds health_poll{500};
        std::chrono::milliseconds backoff_unit{1000};  // attempt n sleeps n * unit
        int max_retries = 2;
    };

    using AbortCheck = std::function<bool()>;

    InferenceClient(HttpTransport& transport, Options options);

    // Consulted before every attempt and after every network round trip.
    void set_abort_check(AbortCheck check) { abort_check_ = std::move(check); }

    bool check_health();
    bool wait_for_server(std::chrono::milliseconds max_wait);

    InferenceResponse send_request(const std::string& prompt,
                                   const std::optional<std::string>& image_base64,
                                   int max_tokens = 1024);

    nlohmann::json build_payload(const std::string& prompt,
                                 const std::optional<std::string>& image_base64,
                                 int max_tokens) const;

    // Fenced code blocks first, then the first '{' to the last '}'. Objects only.
    static std::optional<nlohmann::json> extract_json(const std::string& text);

    const Options& options() const { return options_; }

private:
    bool should_abort() const { return abort_check_ && abort_check_(); }

    HttpTransport& transport_;
    Options options_;
    AbortCheck abort_check_;
};

const char* to_string(InferenceErrorKind kind);
