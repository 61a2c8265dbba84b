/**
 * @file types.hpp
 * @brief Fundamental types used throughout Beaconfig.
 * @author Dimitris Kafetzis
 *
 * Defines the discovery vocabulary (ListenBinding, Beacon, Endpoint) and the
 * grant vocabulary (ClaimRequest, Token, ConfigMapping, GrantState).
 * All types are designed for value semantics.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace beaconfig {

/// Default UDP port beacons are broadcast on.
inline constexpr uint16_t DEFAULT_BEACON_PORT = 45678;

/// Default prefix identifying a beacon datagram.
inline constexpr std::string_view DEFAULT_MAGIC_PHRASE = "beacon-fakts";

// ─────────────────────────────────────────────
// Discovery Types
// ─────────────────────────────────────────────

/**
 * @brief Where a listen session receives beacons.
 *
 * Immutable once a session starts; the session copies it.
 */
struct ListenBinding {
    std::string address;                                    ///< Empty = all interfaces
    uint16_t port = DEFAULT_BEACON_PORT;
    std::string magic_phrase{DEFAULT_MAGIC_PHRASE};

    bool operator==(const ListenBinding&) const = default;
};

/**
 * @brief A decoded beacon advertising a candidate endpoint url.
 */
struct Beacon {
    std::string url;

    bool operator==(const Beacon&) const = default;
};

/**
 * @brief A resolved, reachable configuration service.
 *
 * Only produced by a successful probe or from static configuration.
 */
struct Endpoint {
    std::string base_url;
    std::string name = "Helper";
    std::optional<std::string> description;
    std::optional<std::string> retrieve_url;
    std::optional<std::string> claim_url;
    std::optional<std::string> version;

    bool operator==(const Endpoint&) const = default;
};

// ─────────────────────────────────────────────
// Grant Types
// ─────────────────────────────────────────────

/// A single configuration value (scalar or structured).
using FaktValue = nlohmann::json;

/// Complete snapshot of claimed configuration, keyed by group or setting name.
using ConfigMapping = std::map<std::string, FaktValue>;

/// Authorization token produced by a Demander. Secret: never logged.
using Token = std::string;

/**
 * @brief Context threaded through demand and claim.
 *
 * The engine reads it but never mutates it.
 */
struct ClaimRequest {
    std::string client_name = "beaconfig";
    std::vector<std::string> scopes;
    bool secure = false;                    ///< Ask the server for secure-only values
    nlohmann::json context = nlohmann::json::object();
};

enum class GrantState : uint8_t {
    Idle,          ///< No endpoint handed over yet
    Demanding,     ///< Waiting for the Demander's token
    Claiming,      ///< Exchanging the token for configuration
    Configured,    ///< Mapping obtained (terminal)
    Failed         ///< Demand or claim failed (terminal)
};

[[nodiscard]] constexpr std::string_view to_string(GrantState state) noexcept {
    switch (state) {
        case GrantState::Idle:       return "idle";
        case GrantState::Demanding:  return "demanding";
        case GrantState::Claiming:   return "claiming";
        case GrantState::Configured: return "configured";
        case GrantState::Failed:     return "failed";
    }
    return "unknown";
}

}  // namespace beaconfig
