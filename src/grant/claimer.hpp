/**
 * @file claimer.hpp
 * @brief Claim capability: exchange a token for configuration.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <stop_token>
#include <string_view>

namespace beaconfig {

class IClaimer {
public:
    virtual ~IClaimer() = default;

    /// Returns the complete mapping or an error; never a partial mapping.
    virtual Result<ConfigMapping> claim(const Token& token,
                                        const Endpoint& endpoint,
                                        const ClaimRequest& request,
                                        std::stop_token stop = {}) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace beaconfig
