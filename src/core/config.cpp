/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <limits>

namespace beaconfig {

namespace {

std::vector<std::string> string_array(toml::node_view<toml::node> node) {
    std::vector<std::string> out;
    if (auto* arr = node.as_array()) {
        for (auto& element : *arr) {
            if (auto value = element.value<std::string>()) {
                out.push_back(*value);
            }
        }
    }
    return out;
}

/// Ceiling for durations and counts read from the file; poll() takes an int.
constexpr int64_t MAX_SETTING = std::numeric_limits<int32_t>::max();

/// The receive poll must stay short enough for stop requests to be noticed.
constexpr int64_t MAX_LISTEN_POLL_MS = 60'000;

/**
 * @brief Read an integer setting in [0, ceiling].
 */
Result<uint32_t> bounded_setting(toml::node_view<toml::node> node, const std::string& key,
                                 int64_t fallback, int64_t ceiling = MAX_SETTING) {
    auto value = node.value_or(fallback);
    if (value < 0 || value > ceiling) {
        return Error{ErrorCode::Config, key + " out of range: " + std::to_string(value)};
    }
    return static_cast<uint32_t>(value);
}

std::optional<std::string> optional_string(toml::node_view<toml::node> node) {
    if (auto value = node.value<std::string>()) return *value;
    return std::nullopt;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Config, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [discovery]
        if (auto discovery = tbl["discovery"]; discovery.is_table()) {
            config.discovery.mode = discovery["mode"].value_or(std::string{"advertised"});
            config.discovery.bind_address = discovery["bind_address"].value_or(std::string{});

            auto port = discovery["broadcast_port"].value_or(int64_t{DEFAULT_BEACON_PORT});
            if (port < 1 || port > 65535) {
                return Error{ErrorCode::Config,
                             "discovery.broadcast_port out of range: " + std::to_string(port)};
            }
            config.discovery.broadcast_port = static_cast<uint16_t>(port);

            config.discovery.magic_phrase =
                discovery["magic_phrase"].value_or(std::string{DEFAULT_MAGIC_PHRASE});
            config.discovery.strict = discovery["strict"].value_or(false);
            auto poll_interval = bounded_setting(discovery["poll_interval_ms"],
                                                 "discovery.poll_interval_ms", 100,
                                                 MAX_LISTEN_POLL_MS);
            if (!poll_interval) return poll_interval.error();
            config.discovery.poll_interval_ms = *poll_interval;

            // [discovery.static]
            if (auto fixed = discovery["static"]; fixed.is_table()) {
                auto& endpoint = config.discovery.static_endpoint;
                endpoint.base_url = fixed["base_url"].value_or(endpoint.base_url);
                endpoint.name = fixed["name"].value_or(endpoint.name);
                endpoint.claim_url = optional_string(fixed["claim_url"]);
                endpoint.retrieve_url = optional_string(fixed["retrieve_url"]);
            }
        }

        // [probe]
        if (auto probe = tbl["probe"]; probe.is_table()) {
            auto timeout = bounded_setting(probe["timeout_ms"], "probe.timeout_ms", 3000);
            if (!timeout) return timeout.error();
            config.probe.timeout_ms = *timeout;
            config.probe.allow_appending_slash = probe["allow_appending_slash"].value_or(true);
            config.probe.auto_protocols = string_array(probe["auto_protocols"]);
            config.probe.well_known_path =
                probe["well_known_path"].value_or(std::string{".well-known/fakts"});
        }

        // [http]
        if (auto http = tbl["http"]; http.is_table()) {
            config.http.ca_file = http["ca_file"].value_or(std::string{});
            config.http.verify_peer = http["verify_peer"].value_or(true);
            config.http.user_agent = http["user_agent"].value_or(config.http.user_agent);
        }

        // [grant]
        if (auto grant = tbl["grant"]; grant.is_table()) {
            config.grant.demander = grant["demander"].value_or(std::string{"static"});
            config.grant.token = grant["token"].value_or(std::string{});
            config.grant.scopes = string_array(grant["scopes"]);
            config.grant.client_name = grant["client_name"].value_or(config.grant.client_name);
            config.grant.secure = grant["secure"].value_or(false);
            auto claim_timeout = bounded_setting(grant["claim_timeout_ms"],
                                                 "grant.claim_timeout_ms", 5000);
            if (!claim_timeout) return claim_timeout.error();
            config.grant.claim_timeout_ms = *claim_timeout;

            // [grant.device_code]
            if (auto device = grant["device_code"]; device.is_table()) {
                auto interval = bounded_setting(device["poll_interval_ms"],
                                                "grant.device_code.poll_interval_ms", 1000);
                if (!interval) return interval.error();
                config.grant.device_code.poll_interval_ms = *interval;

                auto expiration = bounded_setting(device["expiration_s"],
                                                  "grant.device_code.expiration_s", 300);
                if (!expiration) return expiration.error();
                config.grant.device_code.expiration_s = *expiration;
            }
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            auto max_size = bounded_setting(telemetry["max_file_size_mb"],
                                            "telemetry.max_file_size_mb", 10);
            if (!max_size) return max_size.error();
            config.telemetry.max_file_size_mb = *max_size;

            auto rotate = bounded_setting(telemetry["rotate_count"], "telemetry.rotate_count", 3);
            if (!rotate) return rotate.error();
            config.telemetry.rotate_count = *rotate;
        }

        if (auto valid = validate_config(config); !valid) {
            return valid.error();
        }
        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<void> validate_config(const Config& config) {
    const auto& discovery = config.discovery;
    if (discovery.mode != "advertised" && discovery.mode != "static") {
        return Error{ErrorCode::Config, "Unknown discovery.mode: " + discovery.mode};
    }
    if (discovery.broadcast_port == 0) {
        return Error{ErrorCode::Config, "discovery.broadcast_port must be non-zero"};
    }
    if (discovery.mode == "advertised" && discovery.magic_phrase.empty()) {
        return Error{ErrorCode::Config, "discovery.magic_phrase must not be empty"};
    }
    if (discovery.poll_interval_ms == 0 || discovery.poll_interval_ms > MAX_LISTEN_POLL_MS) {
        return Error{ErrorCode::Config, "discovery.poll_interval_ms must be in [1, "
                     + std::to_string(MAX_LISTEN_POLL_MS) + "]"};
    }
    if (discovery.mode == "static" && discovery.static_endpoint.base_url.empty()) {
        return Error{ErrorCode::Config, "discovery.static.base_url must not be empty"};
    }

    const auto& grant = config.grant;
    if (grant.demander != "static" && grant.demander != "device_code") {
        return Error{ErrorCode::Config, "Unknown grant.demander: " + grant.demander};
    }
    if (grant.demander == "device_code" && grant.device_code.poll_interval_ms == 0) {
        return Error{ErrorCode::Config, "grant.device_code.poll_interval_ms must be non-zero"};
    }

    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{ErrorCode::Config, "Unknown telemetry.log_level: " + config.telemetry.log_level};
    }
    return Result<void>{};
}

Config default_config() {
    return Config{};
}

ClaimRequest claim_request_from(const GrantConfig& grant) {
    ClaimRequest request;
    request.client_name = grant.client_name;
    request.scopes = grant.scopes;
    request.secure = grant.secure;
    return request;
}

}  // namespace beaconfig
