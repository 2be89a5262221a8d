#pragma once

#include <stdexcept>
#include <string>

#include <cstddef>
#include <cstdint>

namespace tai64 {

/**
 * @brief Error codes for construction and decoding failures
 */
enum class ErrorCode : uint8_t {
    none = 0,         ///< No error
    out_of_range,     ///< Integral field value outside its legal bound
    buffer_too_small, ///< Fewer bytes (or hex digits) than the fixed width requires
    invalid_hex       ///< Non-hex character inside the decoded hex window
};

/**
 * @brief Field named by an out_of_range error
 */
enum class Field : uint8_t {
    none = 0, ///< Error is not about a field value
    sec,      ///< Seconds, 0..2^63-1
    nano,     ///< Nanoseconds, 0..999999999
    atto      ///< Attoseconds, 0..999999999
};

/**
 * @brief Get human-readable error code string
 */
constexpr const char* error_code_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::none:
            return "No error";
        case ErrorCode::out_of_range:
            return "Field value out of range";
        case ErrorCode::buffer_too_small:
            return "Buffer too small for encoded width";
        case ErrorCode::invalid_hex:
            return "Malformed hex text";
    }
    return "Unknown error";
}

/**
 * @brief Get field name as used in diagnostics
 */
constexpr const char* field_string(Field field) noexcept {
    switch (field) {
        case Field::none:
            return "none";
        case Field::sec:
            return "sec";
        case Field::nano:
            return "nano";
        case Field::atto:
            return "atto";
    }
    return "unknown";
}

/**
 * @brief Legal range of a field, as printed in diagnostics
 */
constexpr const char* field_range_string(Field field) noexcept {
    switch (field) {
        case Field::sec:
            return "0..2**63-1";
        case Field::nano:
        case Field::atto:
            return "0..999999999";
        case Field::none:
            break;
    }
    return "";
}

/**
 * @brief Error information from failed construction or decoding
 *
 * The meaning of the payload fields depends on the code:
 * - out_of_range: `field` names the rejected field, `value` holds the
 *   magnitude of the rejected value and `negative` its sign.
 * - buffer_too_small: `required` is the width in bytes, `value` the number
 *   of bytes supplied.
 * - invalid_hex: `value` is the offset of the offending character.
 *
 * This is a trivially copyable type.
 */
struct Error {
    ErrorCode code{ErrorCode::none}; ///< What went wrong
    Field field{Field::none};        ///< Offending field (out_of_range only)
    uint64_t value{0};               ///< Offending value, byte count or offset
    bool negative{false};            ///< Sign of `value` (out_of_range only)
    std::size_t required{0};         ///< Required bytes (buffer_too_small only)

    /**
     * @brief Get a human-readable error message
     * @return Static string describing the error code
     */
    [[nodiscard]] const char* message() const noexcept { return error_code_string(code); }

    /**
     * @brief Full diagnostic naming the field and value
     */
    [[nodiscard]] std::string describe() const {
        switch (code) {
            case ErrorCode::out_of_range:
                return std::string(field_string(field)) + " must be in " +
                       field_range_string(field) + " (got " + (negative ? "-" : "") +
                       std::to_string(value) + ")";
            case ErrorCode::buffer_too_small:
                return std::string(message()) + ": need " + std::to_string(required) +
                       " bytes, got " + std::to_string(value);
            case ErrorCode::invalid_hex:
                return std::string(message()) + " at offset " + std::to_string(value);
            case ErrorCode::none:
                break;
        }
        return message();
    }

    constexpr bool operator==(const Error&) const noexcept = default;
};

/**
 * @brief Exception thrown by validating constructors
 *
 * Carries the structured Error so callers can inspect the field and value.
 */
class RangeError : public std::out_of_range {
public:
    explicit RangeError(const Error& error) : std::out_of_range(error.describe()), error_(error) {}

    [[nodiscard]] const Error& error() const noexcept { return error_; }
    [[nodiscard]] Field field() const noexcept { return error_.field; }

private:
    Error error_;
};

namespace detail {

inline constexpr Error range_error(Field field, uint64_t magnitude, bool negative) noexcept {
    return Error{.code = ErrorCode::out_of_range,
                 .field = field,
                 .value = magnitude,
                 .negative = negative,
                 .required = 0};
}

inline constexpr Error size_error(std::size_t required, std::size_t supplied) noexcept {
    return Error{.code = ErrorCode::buffer_too_small,
                 .field = Field::none,
                 .value = supplied,
                 .negative = false,
                 .required = required};
}

inline constexpr Error hex_error(std::size_t offset) noexcept {
    return Error{.code = ErrorCode::invalid_hex,
                 .field = Field::none,
                 .value = offset,
                 .negative = false,
                 .required = 0};
}

} // namespace detail

} // namespace tai64
