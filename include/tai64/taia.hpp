#pragma once

#include "tai64/detail/endian.hpp"
#include "tai64/detail/hex.hpp"
#include "tai64/detail/label.hpp"
#include "tai64/detail/range.hpp"
#include "tai64/error.hpp"
#include "tai64/expected.hpp"
#include "tai64/tai.hpp"
#include "tai64/tain.hpp"
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
 * TAI64NA label: seconds, nanoseconds and attoseconds.
 *
 * ## Storage
 * 16 bytes on the wire: uint64_t sec, uint32_t nano, uint32_t atto, all
 * big-endian.
 *
 * ## Comparison
 * Ordered lexicographically by (sec, nano, atto). A TaiN compares as
 * (sec, nano, 0) and a Tai as (sec, 0, 0).
 */
class TaiA {
public:
    static constexpr std::size_t size_bytes = tai64::size_bytes(Precision::attoseconds);
    static constexpr Precision precision = Precision::attoseconds;

    struct Changes {
        std::optional<detail::FieldArg> sec;
        std::optional<detail::FieldArg> nano;
        std::optional<detail::FieldArg> atto;
    };

    template <detail::Integer S, detail::Integer N, detail::Integer A>
    constexpr TaiA(S sec, N nano, A atto)
        : sec_(detail::require_sec(sec)),
          nano_(detail::require_frac(Field::nano, nano)),
          atto_(detail::require_frac(Field::atto, atto)) {}

    constexpr explicit TaiA(const Tai& t) noexcept : sec_(t.sec()), nano_(0), atto_(0) {}

    constexpr explicit TaiA(const TaiN& t) noexcept : sec_(t.sec()), nano_(t.nano()), atto_(0) {}

    // Named constants
    static constexpr TaiA epoch() noexcept { return TaiA(detail::unchecked, EPOCH, 0, 0); }
    static constexpr TaiA min() noexcept { return TaiA(detail::unchecked, SEC_MIN, 0, 0); }
    static constexpr TaiA max() noexcept {
        return TaiA(detail::unchecked, SEC_MAX, FRAC_MAX, FRAC_MAX);
    }

    template <detail::Integer S, detail::Integer N, detail::Integer A>
    static expected<TaiA, Error> make(S sec, N nano, A atto) noexcept {
        if (!detail::sec_in_range(sec)) {
            return unexpected(detail::out_of_range(Field::sec, sec));
        }
        if (!detail::frac_in_range(nano)) {
            return unexpected(detail::out_of_range(Field::nano, nano));
        }
        if (!detail::frac_in_range(atto)) {
            return unexpected(detail::out_of_range(Field::atto, atto));
        }
        return TaiA(detail::unchecked, static_cast<uint64_t>(sec), static_cast<uint32_t>(nano),
                    static_cast<uint32_t>(atto));
    }

    static expected<TaiA, Error> decode(std::span<const uint8_t> bytes) noexcept {
        if (bytes.size() < size_bytes) {
            return unexpected(detail::size_error(size_bytes, bytes.size()));
        }
        return make(detail::load_be<uint64_t>(bytes.data()),
                    detail::load_be<uint32_t>(bytes.data() + 8),
                    detail::load_be<uint32_t>(bytes.data() + 12));
    }

    /// Decode from the first 32 hex digits; trailing text is ignored
    static expected<TaiA, Error> decode_hex(std::string_view text) noexcept {
        std::array<uint8_t, size_bytes> buf{};
        auto filled = detail::hex_decode_prefix(text, buf);
        if (!filled) {
            return unexpected(filled.error());
        }
        return decode(buf);
    }

    constexpr uint64_t sec() const noexcept { return sec_; }
    constexpr uint32_t nano() const noexcept { return nano_; }
    constexpr uint32_t atto() const noexcept { return atto_; }

    /**
     * Sub-second part in seconds.
     *
     * Always computed as (atto * 1e-9 + nano) * 1e-9. The algebraically
     * equal nano / 1e9 + atto / 1e18 rounds differently.
     */
    constexpr double frac() const noexcept { return (atto_ * 1e-9 + nano_) * 1e-9; }

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

    TaiA replace(const Changes& changes = {}) const {
        const uint64_t sec = detail::require_sec(changes.sec.value_or(sec_));
        const uint32_t nano = detail::require_frac(Field::nano, changes.nano.value_or(nano_));
        const uint32_t atto = detail::require_frac(Field::atto, changes.atto.value_or(atto_));
        return TaiA(detail::unchecked, sec, nano, atto);
    }

    constexpr auto operator<=>(const TaiA&) const noexcept = default;

private:
    friend class TaiValue; // Narrowing without re-validation

    constexpr TaiA(detail::Unchecked, uint64_t sec, uint32_t nano, uint32_t atto) noexcept
        : sec_(sec),
          nano_(nano),
          atto_(atto) {}

    void store(uint8_t* out) const noexcept {
        detail::store_be<uint64_t>(out, sec_);
        detail::store_be<uint32_t>(out + 8, nano_);
        detail::store_be<uint32_t>(out + 12, atto_);
    }

    uint64_t sec_;
    uint32_t nano_;
    uint32_t atto_;
};

// Cross-precision comparison against the coarser types, over the
// zero-extended (sec, nano, atto) tuple
constexpr std::strong_ordering operator<=>(const TaiA& a, const TaiN& b) noexcept {
    return detail::compare_labels(a.sec(), a.nano(), a.atto(), b.sec(), b.nano(), 0);
}

constexpr bool operator==(const TaiA& a, const TaiN& b) noexcept {
    return (a <=> b) == 0;
}

constexpr std::strong_ordering operator<=>(const TaiA& a, const Tai& b) noexcept {
    return detail::compare_labels(a.sec(), a.nano(), a.atto(), b.sec(), 0, 0);
}

constexpr bool operator==(const TaiA& a, const Tai& b) noexcept {
    return (a <=> b) == 0;
}

/// Canonical string form: sec, a dot, then nano and atto each zero-padded to 9 digits
inline std::string to_string(const TaiA& t) {
    std::ostringstream oss;
    oss << t.sec() << '.' << std::setfill('0') << std::setw(9) << t.nano() << std::setw(9)
        << t.atto();
    return oss.str();
}

inline std::ostream& operator<<(std::ostream& os, const TaiA& t) {
    return os << to_string(t);
}

} // namespace tai64

namespace std {

template <>
struct hash<tai64::TaiA> {
    std::size_t operator()(const tai64::TaiA& t) const noexcept {
        return tai64::detail::hash_label(t.sec(), t.nano(), t.atto());
    }
};

} // namespace std
