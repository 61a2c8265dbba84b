/**
 * @file grant_protocol.cpp
 * @brief GrantProtocol implementation.
 * @author Dimitris Kafetzis
 */

#include "grant/grant_protocol.hpp"

namespace beaconfig {

GrantProtocol::GrantProtocol(IDemander& demander, IClaimer& claimer, Logger& logger)
    : demander_(demander), claimer_(claimer), logger_(logger) {}

std::optional<Error> GrantProtocol::failure() const {
    std::lock_guard lock(failure_mutex_);
    return failure_;
}

void GrantProtocol::transition(GrantState next) {
    auto previous = state_.exchange(next);
    logger_.debug("grant", std::string{"State "} + std::string{to_string(previous)}
                  + " -> " + std::string{to_string(next)});
}

Error GrantProtocol::fail(Error error) {
    {
        std::lock_guard lock(failure_mutex_);
        failure_ = error;
    }
    transition(GrantState::Failed);
    logger_.warn("grant", "Grant failed: " + error.describe());
    return error;
}

Result<ConfigMapping> GrantProtocol::run(const Endpoint& endpoint,
                                         const ClaimRequest& request,
                                         std::stop_token stop) {
    auto expected = GrantState::Idle;
    if (!state_.compare_exchange_strong(expected, GrantState::Demanding)) {
        return Error{ErrorCode::Claim, std::string{"Grant protocol already ran (state "}
                     + std::string{to_string(expected)} + ")"};
    }
    logger_.debug("grant", "State idle -> demanding");

    // ── Demand ────────────────────────────────
    logger_.info("grant", "Demanding token from '" + endpoint.name + "' via "
                 + std::string{demander_.name()} + " demander");
    auto token = demander_.demand(endpoint, request, stop);
    if (!token) {
        const auto& err = token.error();
        if (err.code == ErrorCode::Cancelled || err.code == ErrorCode::Demand) {
            return fail(err);
        }
        return fail(Error{ErrorCode::Demand, err.describe()});
    }
    if (stop.stop_requested()) {
        return fail(Error{ErrorCode::Cancelled, "Grant cancelled after demand"});
    }

    // ── Claim ─────────────────────────────────
    transition(GrantState::Claiming);
    auto mapping = claimer_.claim(*token, endpoint, request, stop);
    if (!mapping) {
        const auto& err = mapping.error();
        if (err.code == ErrorCode::Cancelled || err.code == ErrorCode::Claim) {
            return fail(err);
        }
        return fail(Error{ErrorCode::Claim, err.describe()});
    }

    transition(GrantState::Configured);
    return mapping;
}

}  // namespace beaconfig
