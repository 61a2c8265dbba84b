/**
 * @file datagram_socket.cpp
 * @brief UdpSocket implementation using POSIX sockets and poll().
 * @author Dimitris Kafetzis
 */

#include "network/datagram_socket.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace beaconfig {

namespace {

/// Longest single poll(); callers loop on an empty receive to re-check their stop token.
constexpr uint32_t MAX_RECEIVE_WAIT_MS = 1000;

/**
 * @brief Create a non-blocking UDP socket with SO_REUSEADDR.
 */
int create_udp_socket() {
    int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;

    int optval = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));
    return fd;
}

}  // anonymous namespace

UdpSocket::~UdpSocket() {
    close();
}

Result<void> UdpSocket::bind(const std::string& address, uint16_t port) {
    if (fd_ >= 0) {
        return Error{ErrorCode::Bind, "Socket already bound"};
    }

    sockaddr_in bind_addr{};
    bind_addr.sin_family = AF_INET;
    bind_addr.sin_port = htons(port);
    if (address.empty()) {
        bind_addr.sin_addr.s_addr = INADDR_ANY;
    } else if (::inet_pton(AF_INET, address.c_str(), &bind_addr.sin_addr) != 1) {
        return Error{ErrorCode::Bind, "Invalid bind address: " + address};
    }

    fd_ = create_udp_socket();
    if (fd_ < 0) {
        return Error{ErrorCode::Bind, "Failed to create socket: " + std::string(strerror(errno))};
    }

    if (::bind(fd_, reinterpret_cast<const sockaddr*>(&bind_addr), sizeof(bind_addr)) < 0) {
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        return Error{ErrorCode::Bind, "Bind to " + (address.empty() ? std::string{"*"} : address)
                     + ":" + std::to_string(port) + " failed: " + std::string(strerror(err))};
    }

    return Result<void>{};
}

Result<std::optional<Datagram>> UdpSocket::receive(uint32_t timeout_ms) {
    if (fd_ < 0) {
        return Error{ErrorCode::Io, "Socket is closed"};
    }

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;

    int wait_ms = static_cast<int>(std::min(timeout_ms, MAX_RECEIVE_WAIT_MS));
    int ready = ::poll(&pfd, 1, wait_ms);
    if (ready < 0) {
        if (errno == EINTR) return std::optional<Datagram>{};
        return Error{ErrorCode::Io, "poll failed: " + std::string(strerror(errno))};
    }
    if (ready == 0) {
        return std::optional<Datagram>{};
    }

    std::string buffer(MAX_DATAGRAM_SIZE, '\0');
    sockaddr_in sender_addr{};
    socklen_t addr_len = sizeof(sender_addr);

    auto bytes_read = ::recvfrom(fd_, buffer.data(), buffer.size(), 0,
                                 reinterpret_cast<sockaddr*>(&sender_addr), &addr_len);
    if (bytes_read < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return std::optional<Datagram>{};
        }
        return Error{ErrorCode::Io, "recvfrom failed: " + std::string(strerror(errno))};
    }
    buffer.resize(static_cast<size_t>(bytes_read));

    char ip_buf[INET_ADDRSTRLEN];
    ::inet_ntop(AF_INET, &sender_addr.sin_addr, ip_buf, sizeof(ip_buf));

    return std::optional<Datagram>{Datagram{
        .payload = std::move(buffer),
        .sender_address = ip_buf,
        .sender_port = ntohs(sender_addr.sin_port)
    }};
}

void UdpSocket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool UdpSocket::is_open() const noexcept {
    return fd_ >= 0;
}

uint16_t UdpSocket::local_port() const noexcept {
    if (fd_ < 0) return 0;
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) return 0;
    return ntohs(addr.sin_port);
}

SocketFactory udp_socket_factory() {
    return [] { return std::make_unique<UdpSocket>(); };
}

}  // namespace beaconfig
