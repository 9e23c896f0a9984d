#pragma once

#include <docseek/core/types.h>

#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace docseek::net {

struct HttpResponse {
    long status = 0;
    std::string body;
};

struct HttpRequest {
    std::string url;
    std::vector<std::string> headers; // "Name: value"
    std::string body;
    std::chrono::milliseconds timeout{60000};
};

/**
 * @brief Minimal JSON-over-HTTP client used by the provider adapters
 *
 * Transport failures come back as NetworkError / Timeout /
 * OperationCancelled; HTTP error statuses are returned as responses so the
 * adapter can map them to its own failure kind.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual Result<HttpResponse> post(const HttpRequest& request, std::stop_token stop = {}) = 0;
};

/**
 * @brief libcurl easy-API implementation
 */
class CurlHttpClient : public IHttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    Result<HttpResponse> post(const HttpRequest& request, std::stop_token stop = {}) override;
};

std::shared_ptr<IHttpClient> makeDefaultHttpClient();

} // namespace docseek::net
