/**
 * @file static_discovery.hpp
 * @brief Discovery returning one pre-configured endpoint.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "discovery/discovery.hpp"

namespace beaconfig {

/**
 * @brief Returns a fixed Endpoint immediately; never touches the network.
 */
class StaticDiscovery : public IDiscovery {
public:
    explicit StaticDiscovery(Endpoint endpoint);
    explicit StaticDiscovery(const StaticEndpointConfig& config);

    Result<Endpoint> discover(const ClaimRequest& request, std::stop_token stop = {}) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "static"; }

private:
    Endpoint endpoint_;
};

}  // namespace beaconfig
