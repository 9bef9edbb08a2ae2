#include "curl_transport.hpp"

#include <curl/curl.h>

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

CurlTransport::CurlTransport() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    // One easy handle for the lifetime of the transport keeps the connection alive.
    curl_ = curl_easy_init();
}

CurlTransport::~CurlTransport() {
    if (curl_) curl_easy_cleanup(curl_);
    curl_global_cleanup();
}

std::expected<HttpResponse, TransportError>
CurlTransport::get(const std::string& url, std::chrono::milliseconds timeout) {
    if (!curl_) return std::unexpected(TransportError{TransportError::Kind::Other, "curl_easy_init failed"});

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
    return perform(timeout);
}

std::expected<HttpResponse, TransportError>
CurlTransport::post_json(const std::string& url, const std::string& body, std::chrono::milliseconds timeout) {
    if (!curl_) return std::unexpected(TransportError{TransportError::Kind::Other, "curl_easy_init failed"});

    curl_easy_reset(curl_);

    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);

    auto result = perform(timeout);
    curl_slist_free_all(headers);
    return result;
}

std::expected<HttpResponse, TransportError>
CurlTransport::perform(std::chrono::milliseconds timeout) {
    HttpResponse response;

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        TransportError err{TransportError::Kind::Other, curl_easy_strerror(res)};
        if (res == CURLE_OPERATION_TIMEDOUT) {
            err.kind = TransportError::Kind::Timeout;
        } else if (res == CURLE_COULDNT_CONNECT || res == CURLE_COULDNT_RESOLVE_HOST) {
            err.kind = TransportError::Kind::Connection;
        }
        return std::unexpected(std::move(err));
    }

    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}
