#pragma once
// Label bindings: tai, tain, taia

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>

#include <tai64.hpp>

#include "py_types.hpp"

#include <functional>
#include <sstream>
#include <string>
#include <string_view>

namespace nb = nanobind;
using namespace nb::literals;

namespace tai64_python {

/**
 * @brief Rich comparisons of A against B
 *
 * Registered as operators so an argument of any other type makes the
 * overload set fail with NotImplemented instead of TypeError.
 */
template <typename A, typename B, typename Class>
void def_comparisons(Class& cls) {
    cls.def("__eq__", [](const A& a, const B& b) { return a == b; }, nb::is_operator())
        .def("__ne__", [](const A& a, const B& b) { return a != b; }, nb::is_operator())
        .def("__lt__", [](const A& a, const B& b) { return a < b; }, nb::is_operator())
        .def("__le__", [](const A& a, const B& b) { return a <= b; }, nb::is_operator())
        .def("__gt__", [](const A& a, const B& b) { return a > b; }, nb::is_operator())
        .def("__ge__", [](const A& a, const B& b) { return a >= b; }, nb::is_operator());
}

/**
 * @brief Members every label class shares: codec, conversions, hashing
 */
template <typename T, typename Class>
void def_label_common(Class& cls) {
    cls.def_static(
           "from_hex",
           [](const nb::str& text) { return unwrap(T::decode_hex(std::string_view(text.c_str()))); },
           "Decode from the leading hex digits of a string; trailing text is ignored", "s"_a)
        .def_static(
            "from_hex",
            [](nb::handle text) {
                BufferView view(text);
                auto digits = view.bytes();
                return unwrap(T::decode_hex(
                    std::string_view(reinterpret_cast<const char*>(digits.data()), digits.size())));
            },
            "s"_a)
        .def_static(
            "unpack",
            [](nb::handle buf) {
                BufferView view(buf);
                return unwrap(T::decode(view.bytes()));
            },
            "Decode from the leading bytes of a big-endian buffer (bytes, bytearray, memoryview)",
            "buf"_a)
        .def(
            "pack", [](const T& t) { return to_bytes(t.encode()); },
            "Big-endian wire encoding")
        .def("hex", &T::encode_hex, "Lowercase hex of pack()")
        .def_prop_ro("sec", &T::sec, "Seconds field")
        .def_prop_ro(
            "size", [](const T&) { return T::size_bytes; }, "Encoded width in bytes")
        .def("__float__", &T::to_double)
        .def("__hash__", [](const T& t) { return std::hash<T>{}(t); })
        .def("__str__", [](const T& t) { return tai64::to_string(t); });

    cls.attr("epoch") = T::epoch();
    cls.attr("min") = T::min();
    cls.attr("max") = T::max();
}

inline void bind_labels(nb::module_& m) {
    // =========================================================================
    // tai
    // =========================================================================

    auto tai = nb::class_<tai64::Tai>(m, "tai", "TAI64 label: seconds");
    tai.def(
           "__init__",
           [](tai64::Tai* self, nb::handle sec) {
               new (self) tai64::Tai(make_tai(index_arg(sec, tai64::Field::sec)));
           },
           "sec"_a)
        .def(
            "replace",
            [](const tai64::Tai& t, nb::handle sec) {
                return make_tai(replace_arg(sec, tai64::Field::sec, t.sec()));
            },
            "Copy with the given fields replaced", "sec"_a = nb::none())
        .def("__int__", &tai64::Tai::sec)
        .def("__repr__", [](const tai64::Tai& t) {
            std::ostringstream oss;
            oss << "tai64.tai(" << t.sec() << ")";
            return oss.str();
        });
    def_label_common<tai64::Tai>(tai);

    // =========================================================================
    // tain
    // =========================================================================

    auto tain = nb::class_<tai64::TaiN>(m, "tain", "TAI64N label: seconds and nanoseconds");
    tain.def(
            "__init__",
            [](tai64::TaiN* self, nb::handle sec, nb::handle nano) {
                new (self) tai64::TaiN(make_tain(index_arg(sec, tai64::Field::sec),
                                                 index_arg(nano, tai64::Field::nano)));
            },
            "sec"_a, "nano"_a)
        .def_static(
            "from_tai", [](const tai64::Tai& t) { return tai64::TaiN(t); },
            "Widen a tai label", "t"_a)
        .def(
            "replace",
            [](const tai64::TaiN& t, nb::handle sec, nb::handle nano) {
                return make_tain(replace_arg(sec, tai64::Field::sec, t.sec()),
                                 replace_arg(nano, tai64::Field::nano, t.nano()));
            },
            "Copy with the given fields replaced", "sec"_a = nb::none(), "nano"_a = nb::none())
        .def_prop_ro("nano", &tai64::TaiN::nano, "Nanoseconds field")
        .def("frac", &tai64::TaiN::frac, "Sub-second part in seconds")
        .def("__repr__", [](const tai64::TaiN& t) {
            std::ostringstream oss;
            oss << "tai64.tain(" << t.sec() << ", " << t.nano() << ")";
            return oss.str();
        });
    def_label_common<tai64::TaiN>(tain);

    // =========================================================================
    // taia
    // =========================================================================

    auto taia = nb::class_<tai64::TaiA>(m, "taia",
                                        "TAI64NA label: seconds, nanoseconds and attoseconds");
    taia.def(
            "__init__",
            [](tai64::TaiA* self, nb::handle sec, nb::handle nano, nb::handle atto) {
                new (self) tai64::TaiA(make_taia(index_arg(sec, tai64::Field::sec),
                                                 index_arg(nano, tai64::Field::nano),
                                                 index_arg(atto, tai64::Field::atto)));
            },
            "sec"_a, "nano"_a, "atto"_a)
        .def_static(
            "from_tai", [](const tai64::Tai& t) { return tai64::TaiA(t); },
            "Widen a tai label", "t"_a)
        .def_static(
            "from_tain", [](const tai64::TaiN& t) { return tai64::TaiA(t); },
            "Widen a tain label", "t"_a)
        .def(
            "replace",
            [](const tai64::TaiA& t, nb::handle sec, nb::handle nano, nb::handle atto) {
                return make_taia(replace_arg(sec, tai64::Field::sec, t.sec()),
                                 replace_arg(nano, tai64::Field::nano, t.nano()),
                                 replace_arg(atto, tai64::Field::atto, t.atto()));
            },
            "Copy with the given fields replaced", "sec"_a = nb::none(), "nano"_a = nb::none(),
            "atto"_a = nb::none())
        .def_prop_ro("nano", &tai64::TaiA::nano, "Nanoseconds field")
        .def_prop_ro("atto", &tai64::TaiA::atto, "Attoseconds field")
        .def("frac", &tai64::TaiA::frac, "Sub-second part in seconds")
        .def("__repr__", [](const tai64::TaiA& t) {
            std::ostringstream oss;
            oss << "tai64.taia(" << t.sec() << ", " << t.nano() << ", " << t.atto() << ")";
            return oss.str();
        });
    def_label_common<tai64::TaiA>(taia);

    // Comparisons need all three classes registered
    def_comparisons<tai64::Tai, tai64::Tai>(tai);
    def_comparisons<tai64::Tai, tai64::TaiN>(tai);
    def_comparisons<tai64::Tai, tai64::TaiA>(tai);
    def_comparisons<tai64::TaiN, tai64::TaiN>(tain);
    def_comparisons<tai64::TaiN, tai64::Tai>(tain);
    def_comparisons<tai64::TaiN, tai64::TaiA>(tain);
    def_comparisons<tai64::TaiA, tai64::TaiA>(taia);
    def_comparisons<tai64::TaiA, tai64::Tai>(taia);
    def_comparisons<tai64::TaiA, tai64::TaiN>(taia);
}

} // namespace tai64_python
