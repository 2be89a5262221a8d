#pragma once

#include "tai64/error.hpp"
#include "tai64/expected.hpp"

#include <span>
#include <string>
#include <string_view>

#include <cstddef>
#include <cstdint>

namespace tai64::detail {

inline constexpr char hex_digits[] = "0123456789abcdef";

/// Value of a hex digit (either case), or -1
constexpr int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

/// Lowercase hex of a byte sequence
inline std::string hex_encode(std::span<const uint8_t> bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(hex_digits[b >> 4]);
        out.push_back(hex_digits[b & 0x0F]);
    }
    return out;
}

/**
 * Decode hex text into exactly out.size() bytes.
 *
 * Only the first 2 * out.size() characters are consumed; anything after
 * them is ignored. Text shorter than the window fails with buffer_too_small
 * (sizes in bytes, an odd trailing digit counts for nothing); a non-hex
 * character inside the window fails with invalid_hex.
 */
inline expected<void, Error> hex_decode_prefix(std::string_view text,
                                               std::span<uint8_t> out) noexcept {
    const std::size_t window = out.size() * 2;
    if (text.size() < window) {
        return unexpected(size_error(out.size(), text.size() / 2));
    }

    for (std::size_t i = 0; i < out.size(); ++i) {
        int hi = hex_value(text[2 * i]);
        if (hi < 0) {
            return unexpected(hex_error(2 * i));
        }
        int lo = hex_value(text[2 * i + 1]);
        if (lo < 0) {
            return unexpected(hex_error(2 * i + 1));
        }
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return {};
}

} // namespace tai64::detail
