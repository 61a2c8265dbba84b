/**
 * @file grant_protocol.hpp
 * @brief Demand-then-claim state machine for one resolved endpoint.
 * @author Dimitris Kafetzis
 *
 * Transitions:
 *   Idle -> Demanding -> Claiming -> Configured
 *   Demanding | Claiming -> Failed  (originating error kept in failure())
 *
 * One run per instance; there is no retry. Demander failures surface as
 * Demand errors, Claimer failures as Claim errors, and cancellation as
 * Cancelled regardless of which step it interrupted.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "grant/claimer.hpp"
#include "grant/demander.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <stop_token>

namespace beaconfig {

class GrantProtocol {
public:
    GrantProtocol(IDemander& demander, IClaimer& claimer, Logger& logger);

    /**
     * @brief Run demand then claim against the endpoint.
     *
     * Calling run() on an instance that already left Idle returns a Claim
     * error without contacting any collaborator.
     */
    Result<ConfigMapping> run(const Endpoint& endpoint,
                              const ClaimRequest& request,
                              std::stop_token stop = {});

    [[nodiscard]] GrantState state() const noexcept { return state_.load(); }

    /// Error that moved the machine to Failed, if any.
    [[nodiscard]] std::optional<Error> failure() const;

private:
    void transition(GrantState next);
    Error fail(Error error);

    IDemander& demander_;
    IClaimer& claimer_;
    Logger& logger_;
    std::atomic<GrantState> state_{GrantState::Idle};
    mutable std::mutex failure_mutex_;
    std::optional<Error> failure_;
};

}  // namespace beaconfig
