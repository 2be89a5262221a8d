#pragma once
// Core bindings: constants, Precision

#include <nanobind/nanobind.h>

#include <tai64/types.hpp>

#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace tai64_python {

inline void bind_core(nb::module_& m) {
    // =========================================================================
    // Constants
    // =========================================================================

    m.attr("EPOCH") = tai64::EPOCH;
    m.attr("MIN") = tai64::SEC_MIN;
    m.attr("MAX") = tai64::SEC_MAX;
    m.attr("UNIX_EPOCH") = tai64::UNIX_EPOCH;

    // =========================================================================
    // Precision
    // =========================================================================

    nb::enum_<tai64::Precision>(m, "Precision", "Precision level of a TAI64 label")
        .value("seconds", tai64::Precision::seconds, "TAI64, 8 bytes")
        .value("nanoseconds", tai64::Precision::nanoseconds, "TAI64N, 12 bytes")
        .value("attoseconds", tai64::Precision::attoseconds, "TAI64NA, 16 bytes")
        .def("__str__",
             [](tai64::Precision p) { return std::string(tai64::precision_string(p)); });

    m.def("size_bytes", &tai64::size_bytes, "Encoded width in bytes for a precision",
          "precision"_a);
}

} // namespace tai64_python
