/**
 * @file endpoint_probe.hpp
 * @brief Metadata probe turning a beacon url into an Endpoint.
 * @author Dimitris Kafetzis
 *
 * One probe is one outbound GET of <url>/<well_known_path> (or one per
 * auto-protocol for scheme-less urls). No retry: retry policy belongs to
 * the discovery loop, which moves on to the next beacon.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "network/http_client.hpp"

#include <stop_token>
#include <string>
#include <vector>

namespace beaconfig {

// ─────────────────────────────────────────────
// IEndpointProbe
// ─────────────────────────────────────────────

/**
 * @brief Resolves a candidate url to an Endpoint.
 *
 * Failures use the recoverable probe codes (Transport, Timeout, HttpStatus,
 * Payload), or Cancelled when the stop token fires.
 */
class IEndpointProbe {
public:
    virtual ~IEndpointProbe() = default;

    virtual Result<Endpoint> probe(const std::string& url, std::stop_token stop = {}) = 0;
};

// ─────────────────────────────────────────────
// HttpEndpointProbe
// ─────────────────────────────────────────────

class HttpEndpointProbe : public IEndpointProbe {
public:
    HttpEndpointProbe(IHttpClient& http, ProbeConfig config);

    Result<Endpoint> probe(const std::string& url, std::stop_token stop = {}) override;

    /// Urls to try, in order, after slash and scheme normalisation.
    [[nodiscard]] std::vector<std::string> candidate_urls(const std::string& url) const;

    /// Parse a well-known metadata document. base_url is used when absent.
    static Result<Endpoint> parse_endpoint(const std::string& body, const std::string& base_url);

private:
    Result<Endpoint> probe_one(const std::string& base_url, std::stop_token stop);

    IHttpClient& http_;
    ProbeConfig config_;
};

}  // namespace beaconfig
