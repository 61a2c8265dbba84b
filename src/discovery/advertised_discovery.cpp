/**
 * @file advertised_discovery.cpp
 * @brief AdvertisedDiscovery implementation.
 * @author Dimitris Kafetzis
 */

#include "discovery/advertised_discovery.hpp"

namespace beaconfig {

AdvertisedDiscovery::AdvertisedDiscovery(DiscoveryConfig config,
                                         IEndpointProbe& probe,
                                         Logger& logger,
                                         SocketFactory socket_factory)
    : config_(std::move(config))
    , probe_(probe)
    , logger_(logger)
    , listener_(logger, std::move(socket_factory), config_.poll_interval_ms) {}

ListenBinding AdvertisedDiscovery::binding() const {
    return ListenBinding{
        .address = config_.bind_address,
        .port = config_.broadcast_port,
        .magic_phrase = config_.magic_phrase
    };
}

Result<Endpoint> AdvertisedDiscovery::discover(const ClaimRequest& /*request*/,
                                               std::stop_token stop) {
    auto beacons = listener_.listen_deduplicated(binding(), config_.strict);
    if (!beacons) return beacons.error();

    return first_resolving(*beacons, stop);
}

template <BeaconSourceLike Source>
Result<Endpoint> AdvertisedDiscovery::first_resolving(Source& beacons, std::stop_token stop) {
    size_t attempts = 0;

    while (true) {
        auto beacon = beacons.next(stop);
        if (!beacon) {
            const auto& err = beacon.error();
            if (err.code == ErrorCode::Cancelled) return err;
            return Error{ErrorCode::Discovery,
                         "No endpoint found after " + std::to_string(attempts)
                         + " beacon(s); beacon stream ended (" + err.describe() + ")"};
        }

        ++attempts;
        auto endpoint = probe_.probe(beacon->url, stop);
        if (endpoint) {
            beacons.cancel();
            logger_.info("discovery", "Resolved endpoint '" + endpoint->name + "' at "
                         + endpoint->base_url + " from beacon " + beacon->url);
            return endpoint;
        }

        const auto& err = endpoint.error();
        if (!is_recoverable_probe_failure(err.code)) {
            beacons.cancel();
            return err;
        }
        logger_.warn("discovery", "Could not connect to beacon " + beacon->url + ": "
                     + err.describe());
    }
}

}  // namespace beaconfig
