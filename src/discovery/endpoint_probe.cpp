/**
 * @file endpoint_probe.cpp
 * @brief HttpEndpointProbe implementation.
 * @author Dimitris Kafetzis
 */

#include "discovery/endpoint_probe.hpp"

#include <nlohmann/json.hpp>

namespace beaconfig {

namespace {

/// Optional string member; null and absent both map to nullopt.
Result<std::optional<std::string>> optional_member(const nlohmann::json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) return std::optional<std::string>{};
    if (!it->is_string()) {
        return Error{ErrorCode::Payload, std::string{"Endpoint field '"} + key + "' is not a string"};
    }
    return std::optional<std::string>{it->get<std::string>()};
}

}  // anonymous namespace

HttpEndpointProbe::HttpEndpointProbe(IHttpClient& http, ProbeConfig config)
    : http_(http), config_(std::move(config)) {}

std::vector<std::string> HttpEndpointProbe::candidate_urls(const std::string& url) const {
    std::string normalized = url;
    if (config_.allow_appending_slash && !normalized.empty() && normalized.back() != '/') {
        normalized += '/';
    }

    if (normalized.find("://") != std::string::npos || config_.auto_protocols.empty()) {
        return {normalized};
    }

    std::vector<std::string> candidates;
    candidates.reserve(config_.auto_protocols.size());
    for (const auto& protocol : config_.auto_protocols) {
        candidates.push_back(protocol + "://" + normalized);
    }
    return candidates;
}

Result<Endpoint> HttpEndpointProbe::probe(const std::string& url, std::stop_token stop) {
    if (url.empty()) {
        return Error{ErrorCode::Payload, "Beacon url is empty"};
    }

    std::optional<Error> last_error;
    for (const auto& candidate : candidate_urls(url)) {
        auto endpoint = probe_one(candidate, stop);
        if (endpoint) return endpoint;
        if (endpoint.error().code == ErrorCode::Cancelled) return endpoint;
        last_error = endpoint.error();
    }
    return *last_error;
}

Result<Endpoint> HttpEndpointProbe::probe_one(const std::string& base_url, std::stop_token stop) {
    auto well_known = base_url + config_.well_known_path;

    auto response = http_.get(well_known, config_.timeout_ms, stop);
    if (!response) return response.error();

    if (!response->ok()) {
        return Error{ErrorCode::HttpStatus, "GET " + well_known + " returned HTTP "
                     + std::to_string(response->status)};
    }
    return parse_endpoint(response->body, base_url);
}

Result<Endpoint> HttpEndpointProbe::parse_endpoint(const std::string& body,
                                                   const std::string& base_url) {
    auto doc = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Error{ErrorCode::Payload, "Endpoint metadata is not a JSON object"};
    }

    Endpoint endpoint;
    endpoint.base_url = base_url;

    auto advertised_base = optional_member(doc, "base_url");
    if (!advertised_base) return advertised_base.error();
    if (*advertised_base) endpoint.base_url = **advertised_base;

    auto name = optional_member(doc, "name");
    if (!name) return name.error();
    if (*name) endpoint.name = **name;

    auto description = optional_member(doc, "description");
    if (!description) return description.error();
    endpoint.description = *description;

    auto retrieve_url = optional_member(doc, "retrieve_url");
    if (!retrieve_url) return retrieve_url.error();
    endpoint.retrieve_url = *retrieve_url;

    auto claim_url = optional_member(doc, "claim_url");
    if (!claim_url) return claim_url.error();
    endpoint.claim_url = *claim_url;

    auto version = optional_member(doc, "version");
    if (!version) return version.error();
    endpoint.version = *version;

    if (endpoint.base_url.empty()) {
        return Error{ErrorCode::Payload, "Endpoint metadata has an empty base_url"};
    }
    return endpoint;
}

}  // namespace beaconfig
