/**
 * @file result.hpp
 * @brief Monadic error handling type for Beaconfig.
 * @author Dimitris Kafetzis
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Every
 * fallible operation (socket I/O, HTTP exchanges, payload parsing, the grant
 * state machine) reports failure through an Error carrying an ErrorCode, so
 * callers can branch on the kind of failure rather than on message text.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace beaconfig {

// ─────────────────────────────────────────────
// Error Codes
// ─────────────────────────────────────────────

enum class ErrorCode : uint8_t {
    Bind,           ///< Discovery socket could not be opened or bound
    Decode,         ///< Datagram is not UTF-8 or its JSON body is malformed
    Frame,          ///< Datagram does not start with the magic phrase
    Transport,      ///< Network failure talking to a remote endpoint
    Timeout,        ///< Remote endpoint did not answer in time
    HttpStatus,     ///< Remote endpoint answered with a non-2xx status
    Payload,        ///< Remote endpoint answered with an unusable body
    Discovery,      ///< No endpoint could be resolved
    Demand,         ///< Token could not be obtained
    Claim,          ///< Token could not be exchanged for configuration
    MissingGroup,   ///< Claimed configuration has no such group
    Config,         ///< Local configuration is missing or invalid
    Cancelled,      ///< Caller requested cancellation
    Io              ///< Local socket I/O failure after bind
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Bind:         return "bind";
        case ErrorCode::Decode:       return "decode";
        case ErrorCode::Frame:        return "frame";
        case ErrorCode::Transport:    return "transport";
        case ErrorCode::Timeout:      return "timeout";
        case ErrorCode::HttpStatus:   return "http_status";
        case ErrorCode::Payload:      return "payload";
        case ErrorCode::Discovery:    return "discovery";
        case ErrorCode::Demand:       return "demand";
        case ErrorCode::Claim:        return "claim";
        case ErrorCode::MissingGroup: return "missing_group";
        case ErrorCode::Config:       return "config";
        case ErrorCode::Cancelled:    return "cancelled";
        case ErrorCode::Io:           return "io";
    }
    return "unknown";
}

/**
 * @brief Failures an endpoint probe may report without aborting discovery.
 *
 * Anything outside this set (cancellation in particular) stops the
 * discovery loop instead of moving on to the next beacon.
 */
[[nodiscard]] constexpr bool is_recoverable_probe_failure(ErrorCode code) noexcept {
    return code == ErrorCode::Transport
        || code == ErrorCode::Timeout
        || code == ErrorCode::HttpStatus
        || code == ErrorCode::Payload;
}

// ─────────────────────────────────────────────
// Error
// ─────────────────────────────────────────────

/**
 * @brief Error type carrying a failure kind and a descriptive message.
 */
struct Error {
    ErrorCode code;
    std::string message;

    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    /// "<kind>: <message>", for logs and CLI output.
    [[nodiscard]] std::string describe() const {
        return std::string{to_string(code)} + ": " + message;
    }
};

/**
 * @brief Result<T, E>: a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    /// Construct a success result.
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)

    /// Construct an error result.
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    // ── Monadic operations ────────────────────

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

}  // namespace beaconfig
