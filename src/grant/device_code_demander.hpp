/**
 * @file device_code_demander.hpp
 * @brief Demander obtaining a token through out-of-band device-code approval.
 * @author Dimitris Kafetzis
 *
 * Exchange:
 *   1. POST <base>start/      {"manifest": {"identifier", "scopes"}, "expiration_time_seconds"}
 *                              -> {"code": ".."}
 *   2. prompt(<base>configure/?device_code=<code>, code)
 *   3. POST <base>challenge/  {"code": ..} every poll_interval_ms
 *                              -> {"status": "pending"}                 keep polling
 *                              -> {"status": "granted", "token": ..}    done
 *                              -> {"status": "denied" | "error", ..}   Demand error
 *
 * The device code is handed to the prompt only; it is not logged.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "grant/demander.hpp"
#include "network/http_client.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace beaconfig {

/// Shows the verification url to a human. Called once per demand.
using VerificationPrompt =
    std::function<void(const std::string& verification_url, const std::string& device_code)>;

class DeviceCodeDemander : public IDemander {
public:
    DeviceCodeDemander(IHttpClient& http,
                       DeviceCodeConfig config,
                       uint32_t request_timeout_ms,
                       Logger& logger,
                       VerificationPrompt prompt);

    Result<Token> demand(const Endpoint& endpoint,
                         const ClaimRequest& request,
                         std::stop_token stop = {}) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "device_code"; }

    [[nodiscard]] static std::string verification_url(const std::string& base_url,
                                                      const std::string& device_code);

private:
    Result<std::string> start(const std::string& base, const ClaimRequest& request,
                              std::stop_token stop);
    Result<Token> await_grant(const std::string& base, const std::string& code,
                              std::stop_token stop);

    /// Sleep one poll interval in short slices; false if stop was requested.
    bool wait_interval(std::stop_token stop) const;

    IHttpClient& http_;
    DeviceCodeConfig config_;
    uint32_t request_timeout_ms_;
    Logger& logger_;
    VerificationPrompt prompt_;
};

}  // namespace beaconfig
