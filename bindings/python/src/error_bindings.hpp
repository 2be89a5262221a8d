#pragma once
// Error bindings: RangeError, DecodeError

#include <nanobind/nanobind.h>

#include <tai64/error.hpp>

#include "py_types.hpp"

#include <stdexcept>

namespace nb = nanobind;

namespace tai64_python {

inline void bind_errors(nb::module_& m) {
    // RangeError - a field value outside its legal bound.
    // Also translates tai64::RangeError thrown from C++.
    auto range_error = nb::exception<tai64::RangeError>(m, "RangeError", PyExc_ValueError);
    range_error_type = range_error.ptr();

    // DecodeError - short buffer or malformed hex text
    auto decode_error = nb::exception<std::runtime_error>(m, "DecodeError", PyExc_ValueError);
    decode_error_type = decode_error.ptr();
}

} // namespace tai64_python
