#pragma once

#include <cstddef>
#include <cstdint>

namespace tai64 {

// ============================================================================
// Label constants
// ============================================================================

/// Label of 1970-01-01 00:00:00 TAI
inline constexpr uint64_t EPOCH = uint64_t{1} << 62;

/// Smallest valid seconds field
inline constexpr uint64_t SEC_MIN = 0;

/// Largest valid seconds field (2^63 - 1, never negative as a signed 64-bit integer)
inline constexpr uint64_t SEC_MAX = (uint64_t{1} << 63) - 1;

/// Label of 1970-01-01 00:00:00 UTC (TAI was 10 seconds ahead at that instant)
inline constexpr uint64_t UNIX_EPOCH = EPOCH + 10;

/// Largest valid nanosecond or attosecond field
inline constexpr uint32_t FRAC_MAX = 999'999'999;

/// Subunits per unit for the nano and atto fields
inline constexpr uint32_t FRAC_PER_UNIT = 1'000'000'000;

// ============================================================================
// Precision tag
// ============================================================================

/**
 * Precision level of a TAI64 label.
 *
 * Each level refines the previous one: TAI64 (seconds), TAI64N (adds
 * nanoseconds), TAI64NA (adds attoseconds).
 */
enum class Precision : uint8_t {
    seconds = 0,     ///< TAI64, 8 bytes
    nanoseconds = 1, ///< TAI64N, 12 bytes
    attoseconds = 2  ///< TAI64NA, 16 bytes
};

/// Encoded width in bytes for a precision level
constexpr std::size_t size_bytes(Precision p) noexcept {
    switch (p) {
        case Precision::seconds:
            return 8;
        case Precision::nanoseconds:
            return 12;
        case Precision::attoseconds:
            return 16;
    }
    return 0;
}

/// Human-readable precision name
constexpr const char* precision_string(Precision p) noexcept {
    switch (p) {
        case Precision::seconds:
            return "TAI64";
        case Precision::nanoseconds:
            return "TAI64N";
        case Precision::attoseconds:
            return "TAI64NA";
    }
    return "Unknown";
}

} // namespace tai64
