/**
 * @file advertised_discovery.hpp
 * @brief Discovery via UDP beacons: first endpoint that answers a probe wins.
 * @author Dimitris Kafetzis
 *
 * Listens on the configured binding, takes each distinct beacon in arrival
 * order and probes it. Probes run strictly one at a time. The first success
 * tears the listen session down and is returned; recoverable probe failures
 * are logged and the next beacon is tried. If the beacon stream terminates
 * first (strict-mode decode error, socket failure) discovery fails with
 * Discovery. The listen loop has no overall timeout: it runs until success
 * or until the caller's stop token fires.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "discovery/discovery.hpp"
#include "discovery/endpoint_probe.hpp"
#include "network/beacon_listener.hpp"

namespace beaconfig {

class AdvertisedDiscovery : public IDiscovery {
public:
    AdvertisedDiscovery(DiscoveryConfig config,
                        IEndpointProbe& probe,
                        Logger& logger,
                        SocketFactory socket_factory = udp_socket_factory());

    Result<Endpoint> discover(const ClaimRequest& request, std::stop_token stop = {}) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "advertised"; }

    /// Binding derived from configuration (port, magic phrase, bind address).
    [[nodiscard]] ListenBinding binding() const;

private:
    template <BeaconSourceLike Source>
    Result<Endpoint> first_resolving(Source& beacons, std::stop_token stop);

    DiscoveryConfig config_;
    IEndpointProbe& probe_;
    Logger& logger_;
    BeaconListener listener_;
};

}  // namespace beaconfig
