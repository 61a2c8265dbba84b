/**
 * @file datagram_socket.hpp
 * @brief UDP datagram socket interface and POSIX implementation.
 * @author Dimitris Kafetzis
 *
 * IDatagramSocket is the seam between the beacon listener and the OS. Socket
 * I/O is not on a hot path, so virtual dispatch is used; tests substitute a
 * scripted socket to drive malformed input and mid-receive cancellation.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace beaconfig {

/**
 * @brief One received datagram and its sender.
 */
struct Datagram {
    std::string payload;
    std::string sender_address;
    uint16_t sender_port = 0;
};

// ─────────────────────────────────────────────
// IDatagramSocket
// ─────────────────────────────────────────────

class IDatagramSocket {
public:
    virtual ~IDatagramSocket() = default;

    /// Open and bind. Empty address binds all interfaces.
    virtual Result<void> bind(const std::string& address, uint16_t port) = 0;

    /// Wait up to timeout_ms (at most one second per call) for one datagram. nullopt on timeout.
    virtual Result<std::optional<Datagram>> receive(uint32_t timeout_ms) = 0;

    /// Release the descriptor. Safe to call more than once.
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const noexcept = 0;
};

using SocketFactory = std::function<std::unique_ptr<IDatagramSocket>()>;

// ─────────────────────────────────────────────
// UdpSocket
// ─────────────────────────────────────────────

/**
 * @brief Non-blocking IPv4 UDP socket with SO_REUSEADDR.
 *
 * Several listeners on one host may bind the same beacon port; every bound
 * socket receives each broadcast.
 */
class UdpSocket : public IDatagramSocket {
public:
    static constexpr size_t MAX_DATAGRAM_SIZE = 65507;

    UdpSocket() = default;
    ~UdpSocket() override;

    // Non-copyable
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    Result<void> bind(const std::string& address, uint16_t port) override;
    Result<std::optional<Datagram>> receive(uint32_t timeout_ms) override;
    void close() override;
    [[nodiscard]] bool is_open() const noexcept override;

    /// Port actually bound (useful after binding port 0).
    [[nodiscard]] uint16_t local_port() const noexcept;

private:
    int fd_ = -1;
};

/// Factory producing UdpSocket instances.
SocketFactory udp_socket_factory();

}  // namespace beaconfig
