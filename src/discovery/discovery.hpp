/**
 * @file discovery.hpp
 * @brief Discovery capability: locate a configuration endpoint.
 * @author Dimitris Kafetzis
 *
 * The closed set of implementations is StaticDiscovery and
 * AdvertisedDiscovery, selected from [discovery].mode at startup.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <stop_token>
#include <string_view>

namespace beaconfig {

class IDiscovery {
public:
    virtual ~IDiscovery() = default;

    /**
     * @brief Resolve one endpoint.
     *
     * Fails with Discovery when nothing could be resolved, Bind when the
     * beacon socket cannot be opened, Cancelled on stop request.
     */
    virtual Result<Endpoint> discover(const ClaimRequest& request, std::stop_token stop = {}) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace beaconfig
