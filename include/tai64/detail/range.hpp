#pragma once

#include "tai64/error.hpp"
#include "tai64/types.hpp"

#include <concepts>
#include <type_traits>
#include <utility>

#include <cstdint>

namespace tai64::detail {

/**
 * Integral argument accepted by the validating constructors.
 *
 * bool is excluded so a flag can never silently become a label. Any other
 * argument type (floating point, strings, enums) has no viable constructor.
 */
template <typename T>
concept Integer = std::integral<T> && !std::same_as<std::remove_cv_t<T>, bool>;

/// Tag selecting the non-validating private constructors
struct Unchecked {
    explicit Unchecked() = default;
};

inline constexpr Unchecked unchecked{};

template <Integer T>
constexpr bool sec_in_range(T value) noexcept {
    return !std::cmp_less(value, SEC_MIN) && !std::cmp_greater(value, SEC_MAX);
}

template <Integer T>
constexpr bool frac_in_range(T value) noexcept {
    return !std::cmp_less(value, 0) && !std::cmp_greater(value, FRAC_MAX);
}

/// Build an out_of_range Error without truncating the rejected value
template <Integer T>
constexpr Error out_of_range(Field field, T value) noexcept {
    if constexpr (std::is_signed_v<T>) {
        if (value < 0) {
            // 0 - cast avoids negating the most negative value
            return range_error(field, uint64_t{0} - static_cast<uint64_t>(value), true);
        }
    }
    return range_error(field, static_cast<uint64_t>(value), false);
}

/**
 * Field value passed to replace(), held without truncation.
 *
 * Converts implicitly from any Integer so designated initializers such as
 * `{.nano = -1}` keep the caller's value and sign until validation.
 */
class FieldArg {
public:
    template <Integer T>
    constexpr FieldArg(T value) noexcept
        : negative_(std::cmp_less(value, 0)),
          magnitude_(negative_ ? uint64_t{0} - static_cast<uint64_t>(value)
                               : static_cast<uint64_t>(value)) {}

    constexpr bool negative() const noexcept { return negative_; }
    constexpr uint64_t magnitude() const noexcept { return magnitude_; }

private:
    bool negative_;
    uint64_t magnitude_;
};

/// Checked seconds field; throws RangeError
template <Integer T>
constexpr uint64_t require_sec(T value) {
    if (!sec_in_range(value)) {
        throw RangeError(out_of_range(Field::sec, value));
    }
    return static_cast<uint64_t>(value);
}

/// Checked nano/atto field; throws RangeError
template <Integer T>
constexpr uint32_t require_frac(Field field, T value) {
    if (!frac_in_range(value)) {
        throw RangeError(out_of_range(field, value));
    }
    return static_cast<uint32_t>(value);
}

constexpr uint64_t require_sec(const FieldArg& arg) {
    if (arg.negative() || arg.magnitude() > SEC_MAX) {
        throw RangeError(range_error(Field::sec, arg.magnitude(), arg.negative()));
    }
    return arg.magnitude();
}

constexpr uint32_t require_frac(Field field, const FieldArg& arg) {
    if (arg.negative() || arg.magnitude() > FRAC_MAX) {
        throw RangeError(range_error(field, arg.magnitude(), arg.negative()));
    }
    return static_cast<uint32_t>(arg.magnitude());
}

} // namespace tai64::detail
