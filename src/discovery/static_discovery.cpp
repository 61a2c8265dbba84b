/**
 * @file static_discovery.cpp
 * @brief StaticDiscovery implementation.
 * @author Dimitris Kafetzis
 */

#include "discovery/static_discovery.hpp"

namespace beaconfig {

StaticDiscovery::StaticDiscovery(Endpoint endpoint)
    : endpoint_(std::move(endpoint)) {}

StaticDiscovery::StaticDiscovery(const StaticEndpointConfig& config) {
    endpoint_.base_url = config.base_url;
    endpoint_.name = config.name;
    endpoint_.claim_url = config.claim_url;
    endpoint_.retrieve_url = config.retrieve_url;
}

Result<Endpoint> StaticDiscovery::discover(const ClaimRequest& /*request*/, std::stop_token stop) {
    if (stop.stop_requested()) {
        return Error{ErrorCode::Cancelled, "Static discovery cancelled"};
    }
    return endpoint_;
}

}  // namespace beaconfig
