/**
 * @file client_stack.cpp
 * @brief ClientStack assembly.
 * @author Dimitris Kafetzis
 */

#include "facade/client_stack.hpp"

#include "discovery/advertised_discovery.hpp"
#include "discovery/static_discovery.hpp"
#include "grant/http_claimer.hpp"

namespace beaconfig {

Result<std::unique_ptr<ClientStack>> ClientStack::create(const Config& config,
                                                         Logger& logger,
                                                         std::unique_ptr<IHttpClient> http,
                                                         VerificationPrompt prompt,
                                                         SocketFactory socket_factory) {
    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }

    auto stack = std::make_unique<ClientStack>(ConstructionKey{});

    stack->http_ = http ? std::move(http) : std::make_unique<CurlHttpClient>(config.http);

    // ── Discovery ────────────────────────────
    if (config.discovery.mode == "static") {
        stack->discovery_ = std::make_unique<StaticDiscovery>(config.discovery.static_endpoint);
    } else {
        stack->probe_ = std::make_unique<HttpEndpointProbe>(*stack->http_, config.probe);
        stack->discovery_ = std::make_unique<AdvertisedDiscovery>(
            config.discovery, *stack->probe_, logger, std::move(socket_factory));
    }

    // ── Grant ────────────────────────────────
    if (config.grant.demander == "device_code") {
        stack->demander_ = std::make_unique<DeviceCodeDemander>(
            *stack->http_, config.grant.device_code, config.grant.claim_timeout_ms,
            logger, std::move(prompt));
    } else {
        stack->demander_ = std::make_unique<StaticDemander>(config.grant.token);
    }
    stack->claimer_ = std::make_unique<HttpClaimer>(*stack->http_, config.grant.claim_timeout_ms, logger);

    stack->facade_ = std::make_unique<ConfigFacade>(
        *stack->discovery_, *stack->demander_, *stack->claimer_,
        claim_request_from(config.grant), logger);

    logger.info("stack", std::string{"Client stack ready: "} + std::string{stack->discovery_->name()}
                + " discovery, " + std::string{stack->demander_->name()} + " demander");
    return Result<std::unique_ptr<ClientStack>>(std::move(stack));
}

}  // namespace beaconfig
