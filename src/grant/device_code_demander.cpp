/**
 * @file device_code_demander.cpp
 * @brief DeviceCodeDemander implementation.
 * @author Dimitris Kafetzis
 */

#include "grant/device_code_demander.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <thread>

namespace beaconfig {

namespace {

constexpr auto SLEEP_SLICE = std::chrono::milliseconds(50);

std::string with_trailing_slash(std::string url) {
    if (!url.empty() && url.back() != '/') url += '/';
    return url;
}

std::string string_field(const nlohmann::json& doc, const char* key,
                         std::string fallback = {}) {
    auto it = doc.find(key);
    if (it != doc.end() && it->is_string()) return it->get<std::string>();
    return fallback;
}

Result<nlohmann::json> parse_object(const HttpResponse& response, const std::string& url) {
    if (!response.ok()) {
        return Error{ErrorCode::Demand, url + " returned HTTP " + std::to_string(response.status)};
    }
    auto doc = nlohmann::json::parse(response.body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Error{ErrorCode::Demand, url + " did not return a JSON object"};
    }
    return doc;
}

}  // anonymous namespace

DeviceCodeDemander::DeviceCodeDemander(IHttpClient& http,
                                       DeviceCodeConfig config,
                                       uint32_t request_timeout_ms,
                                       Logger& logger,
                                       VerificationPrompt prompt)
    : http_(http)
    , config_(config)
    , request_timeout_ms_(request_timeout_ms)
    , logger_(logger)
    , prompt_(std::move(prompt)) {}

std::string DeviceCodeDemander::verification_url(const std::string& base_url,
                                                 const std::string& device_code) {
    return with_trailing_slash(base_url) + "configure/?device_code=" + device_code;
}

Result<Token> DeviceCodeDemander::demand(const Endpoint& endpoint,
                                         const ClaimRequest& request,
                                         std::stop_token stop) {
    auto base = with_trailing_slash(endpoint.base_url);

    auto code = start(base, request, stop);
    if (!code) return code.error();

    logger_.info("grant", "Waiting for device-code approval at " + base + "configure/");
    if (prompt_) {
        prompt_(verification_url(base, *code), *code);
    }

    return await_grant(base, *code, stop);
}

Result<std::string> DeviceCodeDemander::start(const std::string& base,
                                              const ClaimRequest& request,
                                              std::stop_token stop) {
    auto url = base + "start/";
    nlohmann::json body = {
        {"manifest", {
            {"identifier", request.client_name},
            {"scopes", request.scopes}
        }},
        {"expiration_time_seconds", config_.expiration_s}
    };

    auto response = http_.post_json(url, body.dump(), request_timeout_ms_, stop);
    if (!response) return response.error();

    auto doc = parse_object(*response, url);
    if (!doc) return doc.error();

    if (string_field(*doc, "status") == "error") {
        return Error{ErrorCode::Demand,
                     "Device-code start rejected: " + string_field(*doc, "message", "no reason given")};
    }

    auto code = string_field(*doc, "code");
    if (code.empty()) {
        return Error{ErrorCode::Demand, url + " did not return a device code"};
    }
    return code;
}

Result<Token> DeviceCodeDemander::await_grant(const std::string& base,
                                              const std::string& code,
                                              std::stop_token stop) {
    auto url = base + "challenge/";
    auto body = nlohmann::json{{"code", code}}.dump();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config_.expiration_s);

    while (true) {
        if (stop.stop_requested()) {
            return Error{ErrorCode::Cancelled, "Device-code demand cancelled"};
        }

        auto response = http_.post_json(url, body, request_timeout_ms_, stop);
        if (!response) return response.error();

        auto doc = parse_object(*response, url);
        if (!doc) return doc.error();

        auto status = string_field(*doc, "status");
        if (status == "granted") {
            auto token = string_field(*doc, "token");
            if (token.empty()) {
                return Error{ErrorCode::Demand, "Device code granted without a token"};
            }
            logger_.info("grant", "Device code approved");
            return token;
        }
        if (status == "denied") {
            return Error{ErrorCode::Demand, "Device code was denied"};
        }
        if (status == "error") {
            return Error{ErrorCode::Demand,
                         "Device-code challenge failed: " + string_field(*doc, "message", "no reason given")};
        }
        if (status != "pending" && status != "waiting") {
            return Error{ErrorCode::Demand, "Unexpected challenge status '" + status + "'"};
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            return Error{ErrorCode::Demand, "Device code expired after "
                         + std::to_string(config_.expiration_s) + "s without approval"};
        }
        if (!wait_interval(stop)) {
            return Error{ErrorCode::Cancelled, "Device-code demand cancelled"};
        }
    }
}

bool DeviceCodeDemander::wait_interval(std::stop_token stop) const {
    auto remaining = std::chrono::milliseconds(config_.poll_interval_ms);
    while (remaining.count() > 0) {
        if (stop.stop_requested()) return false;
        auto slice = std::min(remaining, std::chrono::duration_cast<std::chrono::milliseconds>(SLEEP_SLICE));
        std::this_thread::sleep_for(slice);
        remaining -= slice;
    }
    return !stop.stop_requested();
}

}  // namespace beaconfig
