/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for Beaconfig interfaces.
 * @author Dimitris Kafetzis
 *
 * Defines compile-time interface constraints for the beacon pipeline, so the
 * advertised discovery loop can consume any beacon source without virtual
 * dispatch.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <concepts>
#include <stop_token>

namespace beaconfig {

// ─────────────────────────────────────────────
// BeaconSourceLike
// ─────────────────────────────────────────────

/**
 * @concept BeaconSourceLike
 * @brief Constrains pull-based, cancellable beacon sequences.
 *
 * next() blocks until a beacon, a stop request or a terminal error.
 * cancel() releases the underlying transport and is idempotent.
 */
template <typename T>
concept BeaconSourceLike = requires(T source, std::stop_token stop) {
    { source.next(stop) } -> std::same_as<Result<Beacon>>;
    { source.cancel() } -> std::same_as<void>;
    { source.is_open() } -> std::convertible_to<bool>;
};

}  // namespace beaconfig
