/**
 * @file beacon_codec.cpp
 * @brief BeaconCodec implementation.
 * @author Dimitris Kafetzis
 */

#include "network/beacon_codec.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>

namespace beaconfig {

Result<Beacon> BeaconCodec::decode(std::string_view datagram, std::string_view magic_phrase) {
    if (!is_valid_utf8(datagram)) {
        return Error{ErrorCode::Decode, "Datagram is not valid UTF-8"};
    }

    if (datagram.substr(0, magic_phrase.size()) != magic_phrase) {
        return Error{ErrorCode::Frame, "Datagram does not start with magic phrase"};
    }

    auto body = datagram.substr(magic_phrase.size());
    auto parsed = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return Error{ErrorCode::Decode, "Beacon body is not valid JSON"};
    }
    if (!parsed.is_object()) {
        return Error{ErrorCode::Decode, "Beacon body is not a JSON object"};
    }

    auto url = parsed.find("url");
    if (url == parsed.end() || !url->is_string()) {
        return Error{ErrorCode::Decode, "Beacon body has no string 'url' field"};
    }

    return Beacon{.url = url->get<std::string>()};
}

std::string BeaconCodec::encode(const Beacon& beacon, std::string_view magic_phrase) {
    nlohmann::json body = {{"url", beacon.url}};
    std::string out{magic_phrase};
    out += body.dump();
    return out;
}

bool BeaconCodec::is_valid_utf8(std::string_view text) noexcept {
    size_t i = 0;
    const size_t n = text.size();

    while (i < n) {
        auto lead = static_cast<uint8_t>(text[i]);

        if (lead < 0x80) {
            ++i;
            continue;
        }

        size_t length = 0;
        uint32_t code_point = 0;
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code_point = lead & 0x07;
        } else {
            return false;
        }

        if (i + length > n) return false;

        for (size_t k = 1; k < length; ++k) {
            auto cont = static_cast<uint8_t>(text[i + k]);
            if ((cont & 0xC0) != 0x80) return false;
            code_point = (code_point << 6) | (cont & 0x3F);
        }

        // Reject overlong encodings, surrogates and out-of-range values
        if ((length == 2 && code_point < 0x80)
            || (length == 3 && code_point < 0x800)
            || (length == 4 && code_point < 0x10000)
            || (code_point >= 0xD800 && code_point <= 0xDFFF)
            || code_point > 0x10FFFF) {
            return false;
        }

        i += length;
    }

    return true;
}

}  // namespace beaconfig
