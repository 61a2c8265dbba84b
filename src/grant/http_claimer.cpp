/**
 * @file http_claimer.cpp
 * @brief HttpClaimer implementation.
 * @author Dimitris Kafetzis
 */

#include "grant/http_claimer.hpp"

#include <nlohmann/json.hpp>

namespace beaconfig {

namespace {

std::string with_trailing_slash(std::string url) {
    if (!url.empty() && url.back() != '/') url += '/';
    return url;
}

std::string rejection_message(const nlohmann::json& doc) {
    for (const char* key : {"message", "detail", "error"}) {
        auto it = doc.find(key);
        if (it != doc.end() && it->is_string()) return it->get<std::string>();
    }
    return "no reason given";
}

}  // anonymous namespace

HttpClaimer::HttpClaimer(IHttpClient& http, uint32_t timeout_ms, Logger& logger)
    : http_(http), timeout_ms_(timeout_ms), logger_(logger) {}

std::string HttpClaimer::claim_url_for(const Endpoint& endpoint) {
    if (endpoint.claim_url && !endpoint.claim_url->empty()) {
        return *endpoint.claim_url;
    }
    return with_trailing_slash(endpoint.base_url) + "claim/";
}

Result<ConfigMapping> HttpClaimer::claim(const Token& token,
                                         const Endpoint& endpoint,
                                         const ClaimRequest& request,
                                         std::stop_token stop) {
    auto url = claim_url_for(endpoint);

    nlohmann::json body = {
        {"token", token},
        {"secure", request.secure},
        {"scopes", request.scopes}
    };

    auto response = http_.post_json(url, body.dump(), timeout_ms_, stop);
    if (!response) return response.error();

    if (!response->ok()) {
        auto doc = nlohmann::json::parse(response->body, nullptr, false);
        auto reason = doc.is_object() ? rejection_message(doc) : std::string{"no reason given"};
        return Error{ErrorCode::Claim, "Claim at " + url + " returned HTTP "
                     + std::to_string(response->status) + ": " + reason};
    }

    auto mapping = parse_claim_response(response->body);
    if (mapping) {
        logger_.info("grant", "Claimed " + std::to_string(mapping->size())
                     + " configuration group(s) from " + endpoint.name);
    }
    return mapping;
}

Result<ConfigMapping> HttpClaimer::parse_claim_response(const std::string& body) {
    auto doc = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Error{ErrorCode::Payload, "Claim response is not a JSON object"};
    }

    if (auto status = doc.find("status");
        status != doc.end() && status->is_string() && status->get<std::string>() == "error") {
        return Error{ErrorCode::Claim, "Claim rejected: " + rejection_message(doc)};
    }

    const nlohmann::json* groups = &doc;
    if (auto config = doc.find("config"); config != doc.end()) {
        if (!config->is_object()) {
            return Error{ErrorCode::Payload, "Claim response 'config' is not an object"};
        }
        groups = &*config;
    }

    ConfigMapping mapping;
    for (const auto& [key, value] : groups->items()) {
        mapping.emplace(key, value);
    }
    return mapping;
}

}  // namespace beaconfig
