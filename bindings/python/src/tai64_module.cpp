// TAI64 Python Bindings
// Main module entry point - includes component bindings

#include <nanobind/nanobind.h>

// Binding components
#include "core_bindings.hpp"
#include "error_bindings.hpp"
#include "label_bindings.hpp"

namespace nb = nanobind;

// Define the exception type pointers (declared extern in py_types.hpp)
namespace tai64_python {
PyObject* range_error_type = nullptr;
PyObject* decode_error_type = nullptr;
} // namespace tai64_python

NB_MODULE(tai64, m) {
    m.doc() = "TAI64, TAI64N and TAI64NA time labels";

    // 1. Constants and Precision - no dependencies
    tai64_python::bind_core(m);

    // 2. Error types (sets range_error_type, decode_error_type)
    tai64_python::bind_errors(m);

    // 3. Label classes - need the error types for validation failures
    tai64_python::bind_labels(m);
}
