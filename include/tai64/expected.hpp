#pragma once

// TAI64 Expected Type
//
// Exposes tl::expected in the tai64 namespace for consistent error handling.
// This provides a std::expected-compatible API (C++23) using the TartanLlama
// implementation for C++20 compatibility.
//
// Usage:
//   tai64::expected<TaiN, Error> result = TaiN::decode_hex(text);
//   if (result.has_value()) {
//       process(*result);
//   } else {
//       handle(result.error());
//   }

#include <tl/expected.hpp>

namespace tai64 {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace tai64
