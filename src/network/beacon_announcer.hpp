/**
 * @file beacon_announcer.hpp
 * @brief Periodic UDP broadcast of beacon frames advertising an endpoint url.
 * @author Dimitris Kafetzis
 *
 * Server-side counterpart of BeaconListener. Each datagram is
 * <magic_phrase>{"url": "<url>"}; the frame is encoded once at start.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

namespace beaconfig {

struct AnnouncerOptions {
    std::string target_address = "255.255.255.255";
    uint16_t port = DEFAULT_BEACON_PORT;
    std::string magic_phrase{DEFAULT_MAGIC_PHRASE};
    uint32_t interval_ms = 1000;
};

class BeaconAnnouncer {
public:
    BeaconAnnouncer(Beacon beacon, AnnouncerOptions options, Logger& logger);
    ~BeaconAnnouncer();

    // Non-copyable
    BeaconAnnouncer(const BeaconAnnouncer&) = delete;
    BeaconAnnouncer& operator=(const BeaconAnnouncer&) = delete;

    /// Open the socket and launch the broadcast thread.
    Result<void> start();
    void stop();

    /// Send a single frame on an already-started announcer.
    Result<void> send_once();

    [[nodiscard]] bool running() const noexcept { return broadcast_thread_.joinable(); }
    [[nodiscard]] uint64_t sent_count() const noexcept { return sent_.load(); }

private:
    void broadcast_loop(std::stop_token stop);

    Beacon beacon_;
    AnnouncerOptions options_;
    Logger& logger_;
    std::string frame_;
    int fd_{-1};
    std::atomic<uint64_t> sent_{0};
    std::jthread broadcast_thread_;
};

}  // namespace beaconfig
