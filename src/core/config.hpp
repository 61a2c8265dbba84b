/**
 * @file config.hpp
 * @brief Client configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/result.hpp"
#include "core/types.hpp"

namespace beaconfig {

struct StaticEndpointConfig {
    std::string base_url = "http://localhost:8000/f/";
    std::string name = "Helper";
    std::optional<std::string> claim_url;
    std::optional<std::string> retrieve_url;
};

struct DiscoveryConfig {
    std::string mode = "advertised";        ///< "advertised", "static"
    std::string bind_address;               ///< Empty = all interfaces
    uint16_t broadcast_port = DEFAULT_BEACON_PORT;
    std::string magic_phrase{DEFAULT_MAGIC_PHRASE};
    bool strict = false;                    ///< Terminate on malformed beacons
    uint32_t poll_interval_ms = 100;        ///< Cancellation check granularity
    StaticEndpointConfig static_endpoint;
};

struct ProbeConfig {
    uint32_t timeout_ms = 3000;
    bool allow_appending_slash = true;
    std::vector<std::string> auto_protocols;    ///< Tried in order for scheme-less urls
    std::string well_known_path = ".well-known/fakts";
};

struct HttpConfig {
    std::string ca_file;                    ///< Empty = system bundle
    bool verify_peer = true;
    std::string user_agent = "beaconfig/1.0";
};

struct DeviceCodeConfig {
    uint32_t poll_interval_ms = 1000;
    uint32_t expiration_s = 300;
};

struct GrantConfig {
    std::string demander = "static";        ///< "static", "device_code"
    std::string token;                      ///< Pre-shared token for "static"
    std::vector<std::string> scopes;
    std::string client_name = "beaconfig";
    bool secure = false;
    uint32_t claim_timeout_ms = 5000;
    DeviceCodeConfig device_code;
};

struct TelemetryConfig {
    std::filesystem::path log_dir;          ///< Empty = stdout
    std::string log_level = "info";
    uint32_t max_file_size_mb = 10;
    uint32_t rotate_count = 3;
};

/**
 * @brief Top-level client configuration.
 */
struct Config {
    DiscoveryConfig discovery;
    ProbeConfig probe;
    HttpConfig http;
    GrantConfig grant;
    TelemetryConfig telemetry;
};

/**
 * @brief Load and validate configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Check value ranges and mode names.
 */
Result<void> validate_config(const Config& config);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief ClaimRequest derived from the [grant] section.
 */
ClaimRequest claim_request_from(const GrantConfig& grant);

}  // namespace beaconfig
