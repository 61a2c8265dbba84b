/**
 * @file http_claimer.hpp
 * @brief Claimer performing one HTTP POST against the endpoint's claim url.
 * @author Dimitris Kafetzis
 *
 * Request:  POST <claim_url> {"token": .., "secure": .., "scopes": [..]}
 *           (claim_url defaults to <base_url>claim/)
 * Response: {"config": {...}} or a bare JSON object of groups.
 *           {"status": "error", "message": ..} is a rejected claim.
 */

#pragma once

#include "core/logger.hpp"
#include "grant/claimer.hpp"
#include "network/http_client.hpp"

#include <cstdint>
#include <string>

namespace beaconfig {

class HttpClaimer : public IClaimer {
public:
    HttpClaimer(IHttpClient& http, uint32_t timeout_ms, Logger& logger);

    Result<ConfigMapping> claim(const Token& token,
                                const Endpoint& endpoint,
                                const ClaimRequest& request,
                                std::stop_token stop = {}) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "http"; }

    [[nodiscard]] static std::string claim_url_for(const Endpoint& endpoint);
    static Result<ConfigMapping> parse_claim_response(const std::string& body);

private:
    IHttpClient& http_;
    uint32_t timeout_ms_;
    Logger& logger_;
};

}  // namespace beaconfig
