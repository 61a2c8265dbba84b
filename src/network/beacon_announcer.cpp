/**
 * @file beacon_announcer.cpp
 * @brief BeaconAnnouncer implementation using a POSIX UDP socket.
 * @author Dimitris Kafetzis
 */

#include "network/beacon_announcer.hpp"

#include "network/beacon_codec.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace beaconfig {

BeaconAnnouncer::BeaconAnnouncer(Beacon beacon, AnnouncerOptions options, Logger& logger)
    : beacon_(std::move(beacon))
    , options_(std::move(options))
    , logger_(logger) {}

BeaconAnnouncer::~BeaconAnnouncer() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> BeaconAnnouncer::start() {
    if (fd_ >= 0) return {};

    frame_ = BeaconCodec::encode(beacon_, options_.magic_phrase);

    fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
        return Error{ErrorCode::Bind, std::string{"socket() failed: "} + std::strerror(errno)};
    }

    int optval = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &optval, sizeof(optval)) < 0) {
        auto err = Error{ErrorCode::Bind, std::string{"SO_BROADCAST failed: "} + std::strerror(errno)};
        ::close(fd_);
        fd_ = -1;
        return err;
    }

    logger_.info("announcer", "Announcing " + beacon_.url + " to " + options_.target_address
                 + ":" + std::to_string(options_.port) + " every "
                 + std::to_string(options_.interval_ms) + "ms");

    broadcast_thread_ = std::jthread([this](std::stop_token stop) {
        broadcast_loop(stop);
    });
    return {};
}

void BeaconAnnouncer::stop() {
    if (broadcast_thread_.joinable()) {
        broadcast_thread_.request_stop();
        broadcast_thread_.join();
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

// ─────────────────────────────────────────────
// Sending
// ─────────────────────────────────────────────

Result<void> BeaconAnnouncer::send_once() {
    if (fd_ < 0) {
        return Error{ErrorCode::Io, "Announcer is not started"};
    }

    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(options_.port);
    if (::inet_pton(AF_INET, options_.target_address.c_str(), &dest.sin_addr) != 1) {
        return Error{ErrorCode::Io, "Invalid target address: " + options_.target_address};
    }

    auto sent = ::sendto(fd_, frame_.data(), frame_.size(), 0,
                         reinterpret_cast<const sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) {
        return Error{ErrorCode::Io, std::string{"sendto() failed: "} + std::strerror(errno)};
    }
    sent_.fetch_add(1);
    return {};
}

void BeaconAnnouncer::broadcast_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        auto result = send_once();
        if (!result) {
            logger_.warn("announcer", result.error().describe());
        }

        // Sleep in small increments to respond to stop requests promptly
        auto deadline = std::chrono::steady_clock::now()
                      + std::chrono::milliseconds(options_.interval_ms);
        while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
}

}  // namespace beaconfig
