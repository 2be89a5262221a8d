#pragma once

#include "tai64/detail/endian.hpp"
#include "tai64/detail/hex.hpp"
#include "tai64/detail/label.hpp"
#include "tai64/detail/range.hpp"
#include "tai64/error.hpp"
#include "tai64/expected.hpp"
#include "tai64/types.hpp"

#include <array>
#include <compare>
#include <functional>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include <cstddef>
#include <cstdint>

namespace tai64 {

class TaiValue;

/**
 * TAI64 label: whole SI seconds since the TAI64 origin.
 *
 * ## Storage
 * 8 bytes: uint64_t seconds. Wire format is the same value big-endian.
 *
 * ## Validity
 * sec is limited to 0..2^63-1 so signed 64-bit readers of the wire format
 * never see a negative value. Every constructor and decoder validates;
 * an existing Tai is always in range and never changes.
 *
 * ## Errors
 * - Constructors and replace() throw RangeError.
 * - make(), decode() and decode_hex() return expected<Tai, Error>.
 * - Non-integral constructor arguments do not compile.
 */
class Tai {
public:
    static constexpr std::size_t size_bytes = tai64::size_bytes(Precision::seconds);
    static constexpr Precision precision = Precision::seconds;

    /// Fields to override in replace(); unset fields copy from the source
    struct Changes {
        std::optional<detail::FieldArg> sec;
    };

    template <detail::Integer S>
    constexpr explicit Tai(S sec) : sec_(detail::require_sec(sec)) {}

    // Named constants
    static constexpr Tai epoch() noexcept { return Tai(detail::unchecked, EPOCH); }
    static constexpr Tai min() noexcept { return Tai(detail::unchecked, SEC_MIN); }
    static constexpr Tai max() noexcept { return Tai(detail::unchecked, SEC_MAX); }

    /// Non-throwing construction
    template <detail::Integer S>
    static expected<Tai, Error> make(S sec) noexcept {
        if (!detail::sec_in_range(sec)) {
            return unexpected(detail::out_of_range(Field::sec, sec));
        }
        return Tai(detail::unchecked, static_cast<uint64_t>(sec));
    }

    /**
     * Decode from the first 8 bytes of a buffer.
     *
     * @return buffer_too_small if fewer than 8 bytes are supplied,
     *         out_of_range if the top bit of sec is set
     */
    static expected<Tai, Error> decode(std::span<const uint8_t> bytes) noexcept {
        if (bytes.size() < size_bytes) {
            return unexpected(detail::size_error(size_bytes, bytes.size()));
        }
        return make(detail::load_be<uint64_t>(bytes.data()));
    }

    /// Decode from the first 16 hex digits; trailing text is ignored
    static expected<Tai, Error> decode_hex(std::string_view text) noexcept {
        std::array<uint8_t, size_bytes> buf{};
        auto filled = detail::hex_decode_prefix(text, buf);
        if (!filled) {
            return unexpected(filled.error());
        }
        return decode(buf);
    }

    constexpr uint64_t sec() const noexcept { return sec_; }

    std::array<uint8_t, size_bytes> encode() const noexcept {
        std::array<uint8_t, size_bytes> out{};
        detail::store_be<uint64_t>(out.data(), sec_);
        return out;
    }

    expected<void, Error> encode_into(std::span<uint8_t> out) const noexcept {
        if (out.size() < size_bytes) {
            return unexpected(detail::size_error(size_bytes, out.size()));
        }
        detail::store_be<uint64_t>(out.data(), sec_);
        return {};
    }

    std::string encode_hex() const { return detail::hex_encode(encode()); }

    /// New validated label with the given fields overridden
    Tai replace(const Changes& changes = {}) const {
        return Tai(detail::unchecked, detail::require_sec(changes.sec.value_or(sec_)));
    }

    /// Approximate value in seconds (inexact above 2^53)
    constexpr double to_double() const noexcept { return static_cast<double>(sec_); }

    constexpr explicit operator double() const noexcept { return to_double(); }

    constexpr auto operator<=>(const Tai&) const noexcept = default;

private:
    friend class TaiValue; // Narrowing without re-validation

    constexpr Tai(detail::Unchecked, uint64_t sec) noexcept : sec_(sec) {}

    uint64_t sec_;
};

/// Canonical string form: the bare decimal seconds count
inline std::string to_string(const Tai& t) {
    return std::to_string(t.sec());
}

inline std::ostream& operator<<(std::ostream& os, const Tai& t) {
    return os << to_string(t);
}

} // namespace tai64

namespace std {

template <>
struct hash<tai64::Tai> {
    std::size_t operator()(const tai64::Tai& t) const noexcept {
        return tai64::detail::hash_label(t.sec(), 0, 0);
    }
};

} // namespace std
