// include/tai64/detail/label.hpp
#pragma once

#include <compare>
#include <functional>
#include <tuple>

#include <cstddef>
#include <cstdint>

namespace tai64::detail {

/**
 * Shared comparison and hashing for all precisions.
 *
 * Every label is treated as the zero-extended (sec, nano, atto) tuple: a
 * coarser value passes zero for the fields it does not carry. Comparing and
 * hashing through this one path keeps the cross-precision relation
 * consistent no matter which pair of types is involved.
 */

constexpr std::strong_ordering compare_labels(uint64_t sec_a, uint32_t nano_a, uint32_t atto_a,
                                              uint64_t sec_b, uint32_t nano_b,
                                              uint32_t atto_b) noexcept {
    return std::tie(sec_a, nano_a, atto_a) <=> std::tie(sec_b, nano_b, atto_b);
}

/// Precision-independent hash of a zero-extended label
inline std::size_t hash_label(uint64_t sec, uint32_t nano, uint32_t atto) noexcept {
    std::size_t seed = std::hash<uint64_t>{}(sec);
    auto mix = [&seed](uint32_t v) {
        seed ^= std::hash<uint32_t>{}(v) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    };
    mix(nano);
    mix(atto);
    return seed;
}

} // namespace tai64::detail
