#pragma once

#include "transport.hpp"

#include <curl/curl.h>

class CurlTransport : public HttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    std::expected<HttpResponse, TransportError>
        get(const std::string& url, std::chrono::milliseconds timeout) override;
    std::expected<HttpResponse, TransportError>
        post_json(const std::string& url, const std::string& body, std::chrono::milliseconds timeout) override;

private:
    std::expected<HttpResponse, TransportError> perform(std::chrono::milliseconds timeout);

    CURL* curl_ = nullptr;
};
