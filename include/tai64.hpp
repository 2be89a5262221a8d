#pragma once

/**
 * @file tai64.hpp
 * @brief TAI64, TAI64N and TAI64NA labels
 *
 * Types provided:
 * - tai64::Tai      - seconds precision, 8 bytes on the wire
 * - tai64::TaiN     - nanosecond precision, 12 bytes on the wire
 * - tai64::TaiA     - attosecond precision, 16 bytes on the wire
 * - tai64::TaiValue - any of the above, precision tagged at runtime
 *
 * Values of different precision compare as if the coarser one had zero
 * in the fields it lacks: Tai(s) == TaiN(s, 0) == TaiA(s, 0, 0).
 */

#include "tai64/error.hpp"
#include "tai64/expected.hpp"
#include "tai64/tai.hpp"
#include "tai64/taia.hpp"
#include "tai64/tain.hpp"
#include "tai64/types.hpp"
#include "tai64/value.hpp"
