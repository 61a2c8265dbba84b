/**
 * @file beacon_listener.hpp
 * @brief UDP beacon listening as a pull-based, cancellable stream.
 * @author Dimitris Kafetzis
 *
 * A listen session owns exactly one bound datagram socket. The caller pulls
 * beacons with next(stop_token); each call blocks until a valid beacon
 * arrives, the stop token fires, or a terminal error occurs. The session is
 * not restartable: once it has terminated every later next() reports the
 * same kind of termination, and the socket has been released exactly once.
 *
 * Release happens on every exit path: cancellation, strict-mode decode
 * failure, socket I/O failure, explicit cancel(), and destruction.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "network/datagram_socket.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_set>

namespace beaconfig {

// ─────────────────────────────────────────────
// BeaconStream
// ─────────────────────────────────────────────

class BeaconStream {
public:
    BeaconStream(std::unique_ptr<IDatagramSocket> socket,
                 ListenBinding binding,
                 bool strict,
                 uint32_t poll_interval_ms,
                 Logger& logger);
    ~BeaconStream();

    BeaconStream(BeaconStream&& other) noexcept;
    BeaconStream& operator=(BeaconStream&&) = delete;
    BeaconStream(const BeaconStream&) = delete;
    BeaconStream& operator=(const BeaconStream&) = delete;

    /**
     * @brief Pull the next beacon in arrival order.
     *
     * Errors: Cancelled (stop requested), Decode (strict mode only),
     * Io (socket failure). Frames without the magic phrase are never
     * returned as errors.
     */
    Result<Beacon> next(std::stop_token stop = {});

    /// Terminate the session and release the socket (idempotent).
    void cancel();

    [[nodiscard]] bool is_open() const;
    [[nodiscard]] const ListenBinding& binding() const noexcept { return binding_; }

private:
    Error terminate(Error reason);

    mutable std::mutex mutex_;
    std::unique_ptr<IDatagramSocket> socket_;
    ListenBinding binding_;
    bool strict_;
    uint32_t poll_interval_ms_;
    Logger* logger_;
    std::optional<Error> terminal_;
    std::atomic<bool> cancel_requested_{false};
};

// ─────────────────────────────────────────────
// DeduplicatedBeaconStream
// ─────────────────────────────────────────────

/**
 * @brief Yields each beacon url at most once per session.
 *
 * The seen-set lives and dies with the wrapped session.
 */
class DeduplicatedBeaconStream {
public:
    explicit DeduplicatedBeaconStream(BeaconStream inner);

    Result<Beacon> next(std::stop_token stop = {});
    void cancel();

    [[nodiscard]] bool is_open() const;
    [[nodiscard]] size_t seen_count() const noexcept { return seen_.size(); }

private:
    BeaconStream inner_;
    std::unordered_set<std::string> seen_;
};

static_assert(BeaconSourceLike<BeaconStream>);
static_assert(BeaconSourceLike<DeduplicatedBeaconStream>);

// ─────────────────────────────────────────────
// BeaconListener
// ─────────────────────────────────────────────

/**
 * @brief Opens listen sessions on a ListenBinding.
 */
class BeaconListener {
public:
    static constexpr uint32_t DEFAULT_POLL_INTERVAL_MS = 100;

    explicit BeaconListener(Logger& logger,
                            SocketFactory socket_factory = udp_socket_factory(),
                            uint32_t poll_interval_ms = DEFAULT_POLL_INTERVAL_MS);

    /// Bind and start a session. Fails with Bind; never retried here.
    Result<BeaconStream> listen(const ListenBinding& binding, bool strict = false);

    /// As listen(), wrapped so each url is yielded once.
    Result<DeduplicatedBeaconStream> listen_deduplicated(const ListenBinding& binding,
                                                         bool strict = false);

private:
    Logger& logger_;
    SocketFactory socket_factory_;
    uint32_t poll_interval_ms_;
};

}  // namespace beaconfig
