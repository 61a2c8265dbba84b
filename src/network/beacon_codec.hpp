/**
 * @file beacon_codec.hpp
 * @brief Wire codec for UDP beacon frames.
 * @author Dimitris Kafetzis
 *
 * Wire format (one datagram, UTF-8 text, no length prefix):
 *   <magic phrase><JSON object {"url": "<string>"}>
 *
 * Decoding distinguishes three failure kinds because the listener treats
 * them differently: Frame (no magic prefix, always skipped), Decode
 * (invalid UTF-8 or unusable JSON, fatal in strict mode).
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

namespace beaconfig {

struct BeaconCodec {
    /// Decode one datagram payload into a Beacon.
    static Result<Beacon> decode(std::string_view datagram, std::string_view magic_phrase);

    /// Encode a Beacon into a datagram payload.
    static std::string encode(const Beacon& beacon, std::string_view magic_phrase);

    /// Strict RFC 3629 validation (no overlongs, no surrogates, max U+10FFFF).
    static bool is_valid_utf8(std::string_view text) noexcept;
};

}  // namespace beaconfig
