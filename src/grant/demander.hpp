/**
 * @file demander.hpp
 * @brief Demand capability: obtain an authorization token for an endpoint.
 * @author Dimitris Kafetzis
 *
 * Implementations: StaticDemander (pre-shared token) and DeviceCodeDemander
 * (out-of-band approval), selected from [grant].demander at startup.
 * A demand has a single outcome; there are no partial tokens.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <stop_token>
#include <string_view>

namespace beaconfig {

class IDemander {
public:
    virtual ~IDemander() = default;

    virtual Result<Token> demand(const Endpoint& endpoint,
                                 const ClaimRequest& request,
                                 std::stop_token stop = {}) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief Hands out a token known in advance.
 */
class StaticDemander : public IDemander {
public:
    explicit StaticDemander(Token token) : token_(std::move(token)) {}

    Result<Token> demand(const Endpoint& /*endpoint*/,
                         const ClaimRequest& /*request*/,
                         std::stop_token /*stop*/ = {}) override {
        if (token_.empty()) {
            return Error{ErrorCode::Demand, "No static token configured"};
        }
        return token_;
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "static"; }

private:
    Token token_;
};

}  // namespace beaconfig
