#pragma once
// Conversion helpers shared by the TAI64 bindings

#include <nanobind/nanobind.h>

#include <tai64.hpp>

#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <cstddef>
#include <cstdint>

namespace nb = nanobind;

namespace tai64_python {

// Exception type pointers (set during module init)
extern PyObject* range_error_type;
extern PyObject* decode_error_type;

/**
 * @brief A Python integer argument that fits in 64 bits
 *
 * Non-negative values are held as uint64_t so the whole unsigned range
 * survives; negative values as int64_t. Either alternative is accepted by
 * the validating make() functions.
 */
using PyIndex = std::variant<int64_t, uint64_t>;

/**
 * @brief Raise the Python exception matching a library Error
 *
 * Range failures raise RangeError, everything else DecodeError; both
 * derive from ValueError.
 */
[[noreturn]] inline void raise_error(const tai64::Error& err) {
    PyObject* type =
        err.code == tai64::ErrorCode::out_of_range ? range_error_type : decode_error_type;
    PyErr_SetString(type, err.describe().c_str());
    throw nb::python_error();
}

template <typename T>
T unwrap(tai64::expected<T, tai64::Error> result) {
    if (!result.has_value()) {
        raise_error(result.error());
    }
    return *std::move(result);
}

/**
 * @brief Convert any object supporting __index__ into a PyIndex
 *
 * Non-integers raise TypeError. Integers wider than 64 bits can never be a
 * valid field, so they raise RangeError here with the value's own digits.
 */
inline PyIndex index_arg(nb::handle h, tai64::Field field) {
    nb::object idx = nb::steal(PyNumber_Index(h.ptr()));
    if (!idx.is_valid()) {
        throw nb::python_error();
    }

    int overflow = 0;
    long long value = PyLong_AsLongLongAndOverflow(idx.ptr(), &overflow);
    if (overflow == 0) {
        if (value == -1 && PyErr_Occurred()) {
            throw nb::python_error();
        }
        return static_cast<int64_t>(value);
    }

    if (overflow > 0) {
        unsigned long long uvalue = PyLong_AsUnsignedLongLong(idx.ptr());
        if (!PyErr_Occurred()) {
            return static_cast<uint64_t>(uvalue);
        }
        PyErr_Clear();
    }

    std::string msg = std::string(tai64::field_string(field)) + " must be in " +
                      tai64::field_range_string(field) + " (got " + nb::str(idx).c_str() + ")";
    PyErr_SetString(range_error_type, msg.c_str());
    throw nb::python_error();
}

/// Field value to use for replace(): the argument if given, else the current value
inline PyIndex replace_arg(nb::handle h, tai64::Field field, uint64_t current) {
    if (h.is_none()) {
        return current;
    }
    return index_arg(h, field);
}

/**
 * @brief Contiguous bytes of any object supporting the buffer protocol
 *
 * Accepts bytes, bytearray, memoryview and similar. Objects without a
 * buffer raise TypeError. The buffer is released on destruction.
 */
class BufferView {
public:
    explicit BufferView(nb::handle h) {
        if (PyObject_GetBuffer(h.ptr(), &view_, PyBUF_SIMPLE) != 0) {
            throw nb::python_error();
        }
    }

    ~BufferView() { PyBuffer_Release(&view_); }

    BufferView(const BufferView&) = delete;
    BufferView& operator=(const BufferView&) = delete;

    std::span<const uint8_t> bytes() const noexcept {
        return {static_cast<const uint8_t*>(view_.buf), static_cast<std::size_t>(view_.len)};
    }

private:
    Py_buffer view_{};
};

inline nb::bytes to_bytes(std::span<const uint8_t> data) {
    return nb::bytes(reinterpret_cast<const char*>(data.data()), data.size());
}

// Label construction from Python arguments
inline tai64::Tai make_tai(const PyIndex& sec) {
    return unwrap(std::visit([](auto s) { return tai64::Tai::make(s); }, sec));
}

inline tai64::TaiN make_tain(const PyIndex& sec, const PyIndex& nano) {
    return unwrap(std::visit([](auto s, auto n) { return tai64::TaiN::make(s, n); }, sec, nano));
}

inline tai64::TaiA make_taia(const PyIndex& sec, const PyIndex& nano, const PyIndex& atto) {
    return unwrap(std::visit([](auto s, auto n, auto a) { return tai64::TaiA::make(s, n, a); },
                             sec, nano, atto));
}

} // namespace tai64_python
