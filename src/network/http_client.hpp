/**
 * @file http_client.hpp
 * @brief HTTP transport used for endpoint probes and grant exchanges.
 * @author Dimitris Kafetzis
 *
 * IHttpClient is the boundary to the HTTP collaborator: TLS settings,
 * timeouts and cancellation live behind it. CurlHttpClient is the libcurl
 * implementation; tests script responses through a fake.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"

#include <cstdint>
#include <stop_token>
#include <string>

namespace beaconfig {

struct HttpResponse {
    long status = 0;
    std::string body;

    [[nodiscard]] bool ok() const noexcept { return status >= 200 && status < 300; }
};

// ─────────────────────────────────────────────
// IHttpClient
// ─────────────────────────────────────────────

/**
 * @brief Blocking HTTP exchanges with timeout and cooperative cancellation.
 *
 * A completed exchange is returned whatever its status code; only transport
 * failures are errors (Transport, Timeout, Cancelled).
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual Result<HttpResponse> get(const std::string& url,
                                     uint32_t timeout_ms,
                                     std::stop_token stop = {}) = 0;

    virtual Result<HttpResponse> post_json(const std::string& url,
                                           const std::string& json_body,
                                           uint32_t timeout_ms,
                                           std::stop_token stop = {}) = 0;
};

// ─────────────────────────────────────────────
// CurlHttpClient
// ─────────────────────────────────────────────

class CurlHttpClient : public IHttpClient {
public:
    explicit CurlHttpClient(HttpConfig config);

    Result<HttpResponse> get(const std::string& url,
                             uint32_t timeout_ms,
                             std::stop_token stop = {}) override;

    Result<HttpResponse> post_json(const std::string& url,
                                   const std::string& json_body,
                                   uint32_t timeout_ms,
                                   std::stop_token stop = {}) override;

private:
    Result<HttpResponse> perform(const std::string& url,
                                 const std::string* json_body,
                                 uint32_t timeout_ms,
                                 std::stop_token stop);

    HttpConfig config_;
};

}  // namespace beaconfig
