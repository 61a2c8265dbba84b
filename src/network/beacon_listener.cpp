/**
 * @file beacon_listener.cpp
 * @brief BeaconStream, DeduplicatedBeaconStream and BeaconListener.
 * @author Dimitris Kafetzis
 *
 * The receive loop polls with a short timeout so stop requests and cancel()
 * are observed promptly, the same cooperative pattern the socket loops use
 * elsewhere. The session mutex is held for one poll iteration at a time,
 * which lets cancel() from another thread interleave with an in-flight
 * receive while still releasing the socket exactly once.
 */

#include "network/beacon_listener.hpp"

#include "network/beacon_codec.hpp"

namespace beaconfig {

namespace {

std::string describe(const ListenBinding& binding) {
    return (binding.address.empty() ? std::string{"*"} : binding.address)
         + ":" + std::to_string(binding.port);
}

std::string describe(const Datagram& datagram) {
    return datagram.sender_address + ":" + std::to_string(datagram.sender_port)
         + " (" + std::to_string(datagram.payload.size()) + " bytes)";
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// BeaconStream
// ─────────────────────────────────────────────

BeaconStream::BeaconStream(std::unique_ptr<IDatagramSocket> socket,
                           ListenBinding binding,
                           bool strict,
                           uint32_t poll_interval_ms,
                           Logger& logger)
    : socket_(std::move(socket))
    , binding_(std::move(binding))
    , strict_(strict)
    , poll_interval_ms_(poll_interval_ms)
    , logger_(&logger) {}

BeaconStream::BeaconStream(BeaconStream&& other) noexcept
    : binding_()
    , strict_(false)
    , poll_interval_ms_(0)
    , logger_(nullptr) {
    std::lock_guard lock(other.mutex_);
    socket_ = std::move(other.socket_);
    binding_ = std::move(other.binding_);
    strict_ = other.strict_;
    poll_interval_ms_ = other.poll_interval_ms_;
    logger_ = other.logger_;
    terminal_ = std::move(other.terminal_);
    cancel_requested_.store(other.cancel_requested_.load());
}

BeaconStream::~BeaconStream() {
    cancel();
}

Result<Beacon> BeaconStream::next(std::stop_token stop) {
    while (true) {
        std::lock_guard lock(mutex_);

        if (terminal_) return *terminal_;
        if (!socket_) {
            return terminate(Error{ErrorCode::Io, "Listen session has no socket"});
        }
        if (cancel_requested_.load() || stop.stop_requested()) {
            return terminate(Error{ErrorCode::Cancelled, "Listen on " + describe(binding_)
                                                       + " cancelled"});
        }

        auto received = socket_->receive(poll_interval_ms_);
        if (!received) {
            logger_->error("beacon", "Receive failed: " + received.error().message);
            return terminate(received.error());
        }
        if (!received->has_value()) continue;  // poll timeout

        const Datagram& datagram = **received;
        auto beacon = BeaconCodec::decode(datagram.payload, binding_.magic_phrase);
        if (beacon) {
            logger_->debug("beacon", "Beacon " + beacon->url + " from " + describe(datagram));
            return beacon;
        }

        const auto& err = beacon.error();
        if (err.code == ErrorCode::Frame) {
            // Unrelated broadcast traffic on the same port
            logger_->warn("beacon", "Ignoring non-beacon datagram from " + describe(datagram));
            continue;
        }

        logger_->error("beacon", "Malformed beacon from " + describe(datagram) + ": " + err.message);
        if (strict_) {
            return terminate(err);
        }
    }
}

void BeaconStream::cancel() {
    cancel_requested_.store(true);
    std::lock_guard lock(mutex_);
    if (!terminal_) {
        terminate(Error{ErrorCode::Cancelled, "Listen on " + describe(binding_) + " cancelled"});
    }
}

bool BeaconStream::is_open() const {
    std::lock_guard lock(mutex_);
    return socket_ != nullptr;
}

Error BeaconStream::terminate(Error reason) {
    if (socket_) {
        socket_->close();
        socket_.reset();
        if (logger_) {
            logger_->info("beacon", "Stopped listening on " + describe(binding_)
                          + " (" + std::string{to_string(reason.code)} + ")");
        }
    }
    terminal_ = reason;
    return reason;
}

// ─────────────────────────────────────────────
// DeduplicatedBeaconStream
// ─────────────────────────────────────────────

DeduplicatedBeaconStream::DeduplicatedBeaconStream(BeaconStream inner)
    : inner_(std::move(inner)) {}

Result<Beacon> DeduplicatedBeaconStream::next(std::stop_token stop) {
    while (true) {
        auto beacon = inner_.next(stop);
        if (!beacon) return beacon;
        if (seen_.insert(beacon->url).second) return beacon;
    }
}

void DeduplicatedBeaconStream::cancel() {
    inner_.cancel();
}

bool DeduplicatedBeaconStream::is_open() const {
    return inner_.is_open();
}

// ─────────────────────────────────────────────
// BeaconListener
// ─────────────────────────────────────────────

BeaconListener::BeaconListener(Logger& logger,
                               SocketFactory socket_factory,
                               uint32_t poll_interval_ms)
    : logger_(logger)
    , socket_factory_(std::move(socket_factory))
    , poll_interval_ms_(poll_interval_ms == 0 ? DEFAULT_POLL_INTERVAL_MS : poll_interval_ms) {}

Result<BeaconStream> BeaconListener::listen(const ListenBinding& binding, bool strict) {
    std::unique_ptr<IDatagramSocket> socket;
    if (socket_factory_) socket = socket_factory_();
    if (!socket) {
        return Error{ErrorCode::Bind, "No datagram socket available"};
    }

    if (auto bound = socket->bind(binding.address, binding.port); !bound) {
        logger_.error("beacon", bound.error().message);
        return bound.error();
    }

    logger_.info("beacon", "Listening for beacons on " + describe(binding)
                 + (strict ? " (strict)" : ""));
    return BeaconStream(std::move(socket), binding, strict, poll_interval_ms_, logger_);
}

Result<DeduplicatedBeaconStream> BeaconListener::listen_deduplicated(const ListenBinding& binding,
                                                                     bool strict) {
    auto stream = listen(binding, strict);
    if (!stream) return stream.error();
    return DeduplicatedBeaconStream(std::move(stream).value());
}

}  // namespace beaconfig
