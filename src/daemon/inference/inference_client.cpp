#include "inference_client.hpp"

#include <format>
#include <print>
#include <thread>

using json = nlohmann::json;

namespace {

constexpr const char* ABORTED = "Aborted";

InferenceResponse failure(InferenceErrorKind kind, std::string message) {
    InferenceResponse r;
    r.error = std::move(message);
    r.error_kind = kind;
    return r;
}

std::optional<json> parse_object(const std::string& candidate) {
    auto j = json::parse(candidate, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    return j;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

} // namespace

InferenceClient::InferenceClient(HttpTransport& transport, Options options)
    : transport_(transport), options_(std::move(options)) {
    while (!options_.base_url.empty() && options_.base_url.back() == '/') {
        options_.base_url.pop_back();
    }
}

bool InferenceClient::check_health() {
    auto resp = transport_.get(options_.base_url + "/health", options_.health_timeout);
    return resp && resp->status == 200;
}

bool InferenceClient::wait_for_server(std::chrono::milliseconds max_wait) {
    auto deadline = std::chrono::steady_clock::now() + max_wait;
    while (std::chrono::steady_clock::now() < deadline) {
        if (check_health()) return true;
        if (should_abort()) return false;
        std::this_thread::sleep_for(options_.health_poll);
    }
    return false;
}

json InferenceClient::build_payload(const std::string& prompt,
                                    const std::optional<std::string>& image_base64,
                                    int max_tokens) const {
    json user_content = json::array();
    if (image_base64 && !image_base64->empty()) {
        user_content.push_back({
            {"type", "image_url"},
            {"image_url", {{"url", std::format("data:{};base64,{}", options_.image_mime, *image_base64)}}},
        });
    }
    user_content.push_back({{"type", "text"}, {"text", prompt}});

    return {
        {"model", options_.model},
        {"messages", json::array({
            {{"role", "system"}, {"content", json::array({{{"type", "text"}, {"text", options_.system_prompt}}})}},
            {{"role", "user"}, {"content", std::move(user_content)}},
        })},
        {"temperature", options_.temperature},
        {"top_p", options_.top_p},
        {"max_tokens", max_tokens},
    };
}

InferenceResponse InferenceClient::send_request(const std::string& prompt,
                                                const std::optional<std::string>& image_base64,
                                                int max_tokens) {
    if (should_abort()) return failure(InferenceErrorKind::Aborted, ABORTED);

    const std::string url = options_.base_url + "/v1/chat/completions";
    const std::string body = build_payload(prompt, image_base64, max_tokens).dump();

    for (int attempt = 0; attempt <= options_.max_retries; attempt++) {
        if (should_abort()) {
            std::println(stderr, "model: request aborted");
            return failure(InferenceErrorKind::Aborted, ABORTED);
        }

        auto resp = transport_.post_json(url, body, options_.timeout);

        if (should_abort()) {
            std::println(stderr, "model: request aborted after response");
            return failure(InferenceErrorKind::Aborted, ABORTED);
        }

        InferenceErrorKind kind = InferenceErrorKind::None;
        std::string error;

        if (!resp) {
            switch (resp.error().kind) {
                case TransportError::Kind::Timeout:
                    kind = InferenceErrorKind::Timeout;
                    error = "Model request timed out. The server may be overloaded or processing a complex image.";
                    break;
                case TransportError::Kind::Connection:
                    kind = InferenceErrorKind::Connection;
                    error = "Cannot connect to model server. Check that the server is running.";
                    break;
                case TransportError::Kind::Other:
                    kind = InferenceErrorKind::Network;
                    error = "Network error: " + resp.error().message;
                    break;
            }
        } else if (resp->status < 200 || resp->status >= 300) {
            kind = InferenceErrorKind::Http;
            error = std::format("API error {}: {}", resp->status, resp->body);
        }

        if (kind != InferenceErrorKind::None) {
            if (attempt < options_.max_retries) {
                std::println(stderr, "model: retry {}/{}: {}", attempt + 1, options_.max_retries, error);
                std::this_thread::sleep_for(options_.backoff_unit * (attempt + 1));
                continue;
            }
            return failure(kind, std::move(error));
        }

        json data;
        try {
            data = json::parse(resp->body);
        } catch (const json::exception& e) {
            return failure(InferenceErrorKind::Decode,
                           std::string("Invalid response from model server (not valid JSON): ") + e.what());
        }

        if (!data.contains("choices") || !data["choices"].is_array() || data["choices"].empty()
            || !data["choices"][0].contains("message")
            || !data["choices"][0]["message"].contains("content")
            || !data["choices"][0]["message"]["content"].is_string()) {
            return failure(InferenceErrorKind::Format,
                           "Unexpected response format from model: missing choices[0].message.content");
        }

        InferenceResponse r;
        r.raw_text = data["choices"][0]["message"]["content"].get<std::string>();
        r.parsed = extract_json(r.raw_text);
        r.success = true;
        return r;
    }

    return failure(InferenceErrorKind::Network, "retries exhausted");
}

std::optional<json> InferenceClient::extract_json(const std::string& text) {
    // Fenced blocks first, optionally tagged json.
    size_t pos = 0;
    while ((pos = text.find("```", pos)) != std::string::npos) {
        size_t body = pos + 3;
        if (text.compare(body, 4, "json") == 0) body += 4;
        auto close = text.find("```", body);
        if (close == std::string::npos) break;
        if (auto j = parse_object(trim(text.substr(body, close - body)))) return j;
        pos = close + 3;
    }

    auto start = text.find('{');
    auto end = text.rfind('}');
    if (start != std::string::npos && end != std::string::npos && end > start) {
        return parse_object(text.substr(start, end - start + 1));
    }
    return std::nullopt;
}

const char* to_string(InferenceErrorKind kind) {
    switch (kind) {
        case InferenceErrorKind::None: return "none";
        case InferenceErrorKind::Aborted: return "aborted";
        case InferenceErrorKind::Timeout: return "timeout";
        case InferenceErrorKind::Connection: return "connection";
        case InferenceErrorKind::Http: return "http";
        case InferenceErrorKind::Network: return "network";
        case InferenceErrorKind::Decode: return "decode";
        case InferenceErrorKind::Format: return "format";
    }
    return "unknown";
}
