/**
 * @file client_stack.hpp
 * @brief Owning assembly of the resolve pipeline selected from Config.
 * @author Dimitris Kafetzis
 *
 *   Config -> HTTP client -> Discovery (static | advertised + probe)
 *          -> Demander (static | device_code) -> HttpClaimer -> ConfigFacade
 *
 * Implementations are chosen once here; nothing downstream inspects the
 * configuration mode strings.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "discovery/discovery.hpp"
#include "discovery/endpoint_probe.hpp"
#include "facade/config_facade.hpp"
#include "grant/claimer.hpp"
#include "grant/demander.hpp"
#include "grant/device_code_demander.hpp"
#include "network/datagram_socket.hpp"
#include "network/http_client.hpp"

#include <memory>

namespace beaconfig {

class ClientStack {
    struct ConstructionKey {};

public:
    /// Only create() can name the tag.
    explicit ClientStack(ConstructionKey) {}

    /**
     * @brief Validate config and build every collaborator.
     *
     * @param http    HTTP collaborator; a CurlHttpClient over config.http when null.
     * @param prompt  Receives the device-code verification url.
     */
    static Result<std::unique_ptr<ClientStack>> create(const Config& config,
                                                       Logger& logger,
                                                       std::unique_ptr<IHttpClient> http = nullptr,
                                                       VerificationPrompt prompt = {},
                                                       SocketFactory socket_factory = udp_socket_factory());

    // Non-copyable, non-movable: the facade holds references into the stack
    ClientStack(const ClientStack&) = delete;
    ClientStack& operator=(const ClientStack&) = delete;

    [[nodiscard]] ConfigFacade& facade() noexcept { return *facade_; }
    [[nodiscard]] IDiscovery& discovery() noexcept { return *discovery_; }
    [[nodiscard]] IDemander& demander() noexcept { return *demander_; }

private:
    std::unique_ptr<IHttpClient> http_;
    std::unique_ptr<IEndpointProbe> probe_;
    std::unique_ptr<IDiscovery> discovery_;
    std::unique_ptr<IDemander> demander_;
    std::unique_ptr<IClaimer> claimer_;
    std::unique_ptr<ConfigFacade> facade_;
};

}  // namespace beaconfig
