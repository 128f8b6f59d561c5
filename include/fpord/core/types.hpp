#pragma once

#include <cstdint>

namespace fpord::inline v1 {

// Raw 64-bit storage of a binary64 value, as seen through a bit cast
using storage_type = std::uint64_t;

// Mantissa with room for the explicit leading bit (53 significant bits)
using mantissa_type = std::uint64_t;

// Raw exponent field (0..2047). Signed so that reconstruction can test
// "exponent <= 0" for the subnormal branch.
using exponent_type = std::int16_t;

} // namespace fpord::inline v1
