#pragma once

#include "tai64/detail/label.hpp"
#include "tai64/error.hpp"
#include "tai64/expected.hpp"
#include "tai64/tai.hpp"
#include "tai64/taia.hpp"
#include "tai64/tain.hpp"
#include "tai64/types.hpp"

#include <compare>
#include <concepts>
#include <functional>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <cstddef>
#include <cstdint>

namespace tai64 {

/**
 * Concept for the three typed label classes
 */
template <typename T>
concept Label = std::same_as<T, Tai> || std::same_as<T, TaiN> || std::same_as<T, TaiA>;

/**
 * Type-erased label for precision known only at runtime
 *
 * TaiValue is self-describing: it carries the label fields together with the
 * Precision tag they were read at. Fields a precision does not carry are
 * stored as zero, so ordering and equality are the zero-extended tuple
 * comparison used between the typed labels; the tag itself never takes part.
 *
 * Use as<T>() to narrow back to a typed label when the precision matches.
 */
class TaiValue {
public:
    // Implicit widening from any typed label
    constexpr TaiValue(const Tai& t) noexcept
        : sec_(t.sec()),
          nano_(0),
          atto_(0),
          precision_(Precision::seconds) {}

    constexpr TaiValue(const TaiN& t) noexcept
        : sec_(t.sec()),
          nano_(t.nano()),
          atto_(0),
          precision_(Precision::nanoseconds) {}

    constexpr TaiValue(const TaiA& t) noexcept
        : sec_(t.sec()),
          nano_(t.nano()),
          atto_(t.atto()),
          precision_(Precision::attoseconds) {}

    [[nodiscard]] constexpr uint64_t sec() const noexcept { return sec_; }
    [[nodiscard]] constexpr uint32_t nano() const noexcept { return nano_; }
    [[nodiscard]] constexpr uint32_t atto() const noexcept { return atto_; }
    [[nodiscard]] constexpr Precision precision() const noexcept { return precision_; }
    [[nodiscard]] constexpr std::size_t size_bytes() const noexcept {
        return tai64::size_bytes(precision_);
    }

    /**
     * Narrow to a typed label if the precision matches exactly
     *
     * @tparam T Tai, TaiN or TaiA
     * @return Typed label if precisions match, nullopt otherwise
     */
    template <Label T>
    [[nodiscard]] constexpr std::optional<T> as() const noexcept {
        if (precision_ != T::precision) {
            return std::nullopt;
        }
        return typed<T>();
    }

    /// Decode a label whose width is chosen at runtime
    static expected<TaiValue, Error> decode(Precision p, std::span<const uint8_t> bytes) noexcept {
        switch (p) {
            case Precision::seconds:
                return Tai::decode(bytes).map([](const Tai& t) { return TaiValue(t); });
            case Precision::nanoseconds:
                return TaiN::decode(bytes).map([](const TaiN& t) { return TaiValue(t); });
            case Precision::attoseconds:
                break;
        }
        return TaiA::decode(bytes).map([](const TaiA& t) { return TaiValue(t); });
    }

    static expected<TaiValue, Error> decode_hex(Precision p, std::string_view text) noexcept {
        switch (p) {
            case Precision::seconds:
                return Tai::decode_hex(text).map([](const Tai& t) { return TaiValue(t); });
            case Precision::nanoseconds:
                return TaiN::decode_hex(text).map([](const TaiN& t) { return TaiValue(t); });
            case Precision::attoseconds:
                break;
        }
        return TaiA::decode_hex(text).map([](const TaiA& t) { return TaiValue(t); });
    }

    /// Call f with the typed label matching the precision tag
    template <typename F>
    decltype(auto) visit(F&& f) const {
        switch (precision_) {
            case Precision::seconds:
                return std::invoke(std::forward<F>(f), typed<Tai>());
            case Precision::nanoseconds:
                return std::invoke(std::forward<F>(f), typed<TaiN>());
            case Precision::attoseconds:
                break;
        }
        return std::invoke(std::forward<F>(f), typed<TaiA>());
    }

    std::string encode_hex() const {
        return visit([](const auto& t) { return t.encode_hex(); });
    }

    double to_double() const noexcept {
        return visit([](const auto& t) { return t.to_double(); });
    }

    constexpr std::strong_ordering operator<=>(const TaiValue& other) const noexcept {
        return detail::compare_labels(sec_, nano_, atto_, other.sec_, other.nano_, other.atto_);
    }

    constexpr bool operator==(const TaiValue& other) const noexcept {
        return (*this <=> other) == 0;
    }

private:
    // Fields were validated when the typed label was built
    template <Label T>
    constexpr T typed() const noexcept {
        if constexpr (std::is_same_v<T, Tai>) {
            return Tai(detail::unchecked, sec_);
        } else if constexpr (std::is_same_v<T, TaiN>) {
            return TaiN(detail::unchecked, sec_, nano_);
        } else {
            return TaiA(detail::unchecked, sec_, nano_, atto_);
        }
    }

    uint64_t sec_;
    uint32_t nano_;
    uint32_t atto_;
    Precision precision_;
};

/// Precision implied by a hex string length (16, 24 or 32 digits)
constexpr std::optional<Precision> detect_precision(std::size_t hex_length) noexcept {
    switch (hex_length) {
        case 2 * tai64::size_bytes(Precision::seconds):
            return Precision::seconds;
        case 2 * tai64::size_bytes(Precision::nanoseconds):
            return Precision::nanoseconds;
        case 2 * tai64::size_bytes(Precision::attoseconds):
            return Precision::attoseconds;
        default:
            return std::nullopt;
    }
}

inline std::string to_string(const TaiValue& v) {
    return v.visit([](const auto& t) { return to_string(t); });
}

inline std::ostream& operator<<(std::ostream& os, const TaiValue& v) {
    return os << to_string(v);
}

} // namespace tai64

namespace std {

template <>
struct hash<tai64::TaiValue> {
    std::size_t operator()(const tai64::TaiValue& v) const noexcept {
        return tai64::detail::hash_label(v.sec(), v.nano(), v.atto());
    }
};

} // namespace std
