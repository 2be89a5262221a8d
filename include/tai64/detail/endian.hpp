#pragma once

/**
 * @file endian.hpp
 * @brief Byte swap and big-endian load/store helpers for the wire format
 *
 * All TAI64 fields are stored most-significant byte first. Loads and stores
 * go through memcpy so callers may pass unaligned byte pointers.
 */

#include <cstdint>
#include <cstring>

namespace tai64::detail {

// ============================================================================
// Byte swap implementations
// ============================================================================

inline uint32_t byteswap32(uint32_t value) noexcept {
    return __builtin_bswap32(value);
}

inline uint64_t byteswap64(uint64_t value) noexcept {
    return __builtin_bswap64(value);
}

// ============================================================================
// Platform endianness detection
// ============================================================================

#if defined(__BYTE_ORDER__) && defined(__ORDER_LITTLE_ENDIAN__)
inline constexpr bool is_little_endian = (__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__);
#else
// Fallback assumption: most modern systems are little-endian
inline constexpr bool is_little_endian = true;
#endif

// ============================================================================
// Network byte order conversion functions
// ============================================================================

inline uint32_t host_to_network32(uint32_t value) noexcept {
    if constexpr (is_little_endian) {
        return byteswap32(value);
    } else {
        return value;
    }
}

inline uint64_t host_to_network64(uint64_t value) noexcept {
    if constexpr (is_little_endian) {
        return byteswap64(value);
    } else {
        return value;
    }
}

inline uint32_t network_to_host32(uint32_t value) noexcept {
    return host_to_network32(value); // Same operation (symmetric)
}

inline uint64_t network_to_host64(uint64_t value) noexcept {
    return host_to_network64(value); // Same operation (symmetric)
}

// ============================================================================
// Unchecked big-endian field access (caller guarantees buffer size)
// ============================================================================

template <typename StorageType>
[[nodiscard]] inline StorageType load_be(const uint8_t* data) noexcept {
    static_assert(sizeof(StorageType) == 4 || sizeof(StorageType) == 8);
    StorageType value{};
    std::memcpy(&value, data, sizeof(StorageType));
    if constexpr (sizeof(StorageType) == 4) {
        return network_to_host32(value);
    } else {
        return network_to_host64(value);
    }
}

template <typename StorageType>
inline void store_be(uint8_t* data, StorageType value) noexcept {
    static_assert(sizeof(StorageType) == 4 || sizeof(StorageType) == 8);
    if constexpr (sizeof(StorageType) == 4) {
        value = host_to_network32(value);
    } else {
        value = host_to_network64(value);
    }
    std::memcpy(data, &value, sizeof(StorageType));
}

} // namespace tai64::detail
