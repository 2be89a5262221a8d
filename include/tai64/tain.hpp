#pragma once

#include "tai64/detail/endian.hpp"
#include "tai64/detail/hex.hpp"
#include "tai64/detail/label.hpp"
#include "tai64/detail/range.hpp"
#include "tai64/error.hpp"
#include "tai64/expected.hpp"
#include "tai64/tai.hpp"
#include "tai64/types.hpp"

#include <array>
#include <compare>
#include <functional>
#include <iomanip>
#include <optional>
#include <ostream>
#include <span>
#include <sstream>
#include <string>
#include <string_view>

#include <cstddef>
#include <cstdint>

namespace tai64 {

/**
 * TAI64N label: seconds plus nanoseconds.
 *
 * ## Storage
 * 12 bytes on the wire: uint64_t sec then uint32_t nano, both big-endian.
 *
 * ## Validity
 * sec as for Tai; nano in 0..999999999. A decoded nano above that bound is
 * representable on the wire but rejected with the same out_of_range error
 * the constructor raises.
 *
 * ## Comparison
 * Ordered lexicographically by (sec, nano). Compared against a Tai, the Tai
 * acts as (sec, 0).
 */
class TaiN {
public:
    static constexpr std::size_t size_bytes = tai64::size_bytes(Precision::nanoseconds);
    static constexpr Precision precision = Precision::nanoseconds;

    struct Changes {
        std::optional<detail::FieldArg> sec;
        std::optional<detail::FieldArg> nano;
    };

    template <detail::Integer S, detail::Integer N>
    constexpr TaiN(S sec, N nano)
        : sec_(detail::require_sec(sec)),
          nano_(detail::require_frac(Field::nano, nano)) {}

    /// Widen a Tai with a zero nanosecond field
    constexpr explicit TaiN(const Tai& t) noexcept : sec_(t.sec()), nano_(0) {}

    // Named constants
    static constexpr TaiN epoch() noexcept { return TaiN(detail::unchecked, EPOCH, 0); }
    static constexpr TaiN min() noexcept { return TaiN(detail::unchecked, SEC_MIN, 0); }
    static constexpr TaiN max() noexcept { return TaiN(detail::unchecked, SEC_MAX, FRAC_MAX); }

    template <detail::Integer S, detail::Integer N>
    static expected<TaiN, Error> make(S sec, N nano) noexcept {
        if (!detail::sec_in_range(sec)) {
            return unexpected(detail::out_of_range(Field::sec, sec));
        }
        if (!detail::frac_in_range(nano)) {
            return unexpected(detail::out_of_range(Field::nano, nano));
        }
        return TaiN(detail::unchecked, static_cast<uint64_t>(sec), static_cast<uint32_t>(nano));
    }

    static expected<TaiN, Error> decode(std::span<const uint8_t> bytes) noexcept {
        if (bytes.size() < size_bytes) {
            return unexpected(detail::size_error(size_bytes, bytes.size()));
        }
        return make(detail::load_be<uint64_t>(bytes.data()),
                    detail::load_be<uint32_t>(bytes.data() + 8));
    }

    /// Decode from the first 24 hex digits; trailing text is ignored
    static expected<TaiN, Error> decode_hex(std::string_view text) noexcept {
        std::array<uint8_t, size_bytes> buf{};
        auto filled = detail::hex_decode_prefix(text, buf);
        if (!filled) {
            return unexpected(filled.error());
        }
        return decode(buf);
    }

    constexpr uint64_t sec() const noexcept { return sec_; }
    constexpr uint32_t nano() const noexcept { return nano_; }

    /// Sub-second part in seconds
    constexpr double frac() const noexcept { return nano_ * 1e-9; }

    constexpr double to_double() const noexcept { return static_cast<double>(sec_) + frac(); }

    constexpr explicit operator double() const noexcept { return to_double(); }

    std::array<uint8_t, size_bytes> encode() const noexcept {
        std::array<uint8_t, size_bytes> out{};
        store(out.data());
        return out;
    }

    expected<void, Error> encode_into(std::span<uint8_t> out) const noexcept {
        if (out.size() < size_bytes) {
            return unexpected(detail::size_error(size_bytes, out.size()));
        }
        store(out.data());
        return {};
    }

    std::string encode_hex() const { return detail::hex_encode(encode()); }

    TaiN replace(const Changes& changes = {}) const {
        const uint64_t sec = detail::require_sec(changes.sec.value_or(sec_));
        const uint32_t nano = detail::require_frac(Field::nano, changes.nano.value_or(nano_));
        return TaiN(detail::unchecked, sec, nano);
    }

    constexpr auto operator<=>(const TaiN&) const noexcept = default;

private:
    friend class TaiValue; // Narrowing without re-validation

    constexpr TaiN(detail::Unchecked, uint64_t sec, uint32_t nano) noexcept
        : sec_(sec),
          nano_(nano) {}

    void store(uint8_t* out) const noexcept {
        detail::store_be<uint64_t>(out, sec_);
        detail::store_be<uint32_t>(out + 8, nano_);
    }

    uint64_t sec_;
    uint32_t nano_;
};

// Cross-precision comparison: the Tai is zero-extended to (sec, 0).
// Reversed forms (Tai vs TaiN) are synthesized by the compiler.
constexpr std::strong_ordering operator<=>(const TaiN& a, const Tai& b) noexcept {
    return detail::compare_labels(a.sec(), a.nano(), 0, b.sec(), 0, 0);
}

constexpr bool operator==(const TaiN& a, const Tai& b) noexcept {
    return (a <=> b) == 0;
}

/// Canonical string form: sec, a dot, then nano zero-padded to 9 digits
inline std::string to_string(const TaiN& t) {
    std::ostringstream oss;
    oss << t.sec() << '.' << std::setfill('0') << std::setw(9) << t.nano();
    return oss.str();
}

inline std::ostream& operator<<(std::ostream& os, const TaiN& t) {
    return os << to_string(t);
}

} // namespace tai64

namespace std {

template <>
struct hash<tai64::TaiN> {
    std::size_t operator()(const tai64::TaiN& t) const noexcept {
        return tai64::detail::hash_label(t.sec(), t.nano(), 0);
    }
};

} // namespace std
