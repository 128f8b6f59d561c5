#pragma once

#include <bit>
#include <fpord/core/decomposed.hpp>

namespace fpord::inline v1 {

namespace detail {

// Build a binary64 bit pattern from raw decomposed fields
//
// Exponent 0 (or below) is the subnormal branch, matching decompose_bits():
// the mantissa was stored shifted left by one, so shift it back. Otherwise
// the explicit leading bit is masked off and the exponent placed at bit 52.
// Fields that no finite double produces are composed as-is, without checks.
constexpr storage_type compose_bits(mantissa_type mantissa,
                                    exponent_type exponent, bool sign) {
  using F = Binary64Format;

  storage_type sign_bit = sign ? 0 : F::sign_mask;

  storage_type mant_bits;
  storage_type exp_bits;
  if (exponent <= 0) {
    mant_bits = (mantissa >> 1) & F::mant_mask;
    exp_bits = 0;
  } else {
    mant_bits = mantissa & F::mant_mask;
    exp_bits = static_cast<storage_type>(exponent) << F::exp_offset;
  }

  return sign_bit | exp_bits | mant_bits;
}

} // namespace detail

// Decompose a raw binary64 bit pattern
//
// Returns std::nullopt when the exponent field is all ones (infinity or any
// NaN payload). Absence is the expected answer for such inputs, not an error.
//
// Normal numbers (exponent != 0) get the explicit leading bit at position 52.
// Subnormals and zeros keep their stored bits shifted left by one, with no
// leading bit.
constexpr std::optional<DecomposedFloat> decompose_bits(storage_type bits) {
  using F = Binary64Format;

  auto exponent = static_cast<exponent_type>((bits >> F::exp_offset) &
                                             F::exp_field_mask);
  if (exponent == F::exp_special) {
    return std::nullopt;
  }

  bool sign = (bits & F::sign_mask) == 0;

  mantissa_type stored = bits & F::mant_mask;
  mantissa_type mantissa;
  if (exponent == 0) {
    mantissa = stored << 1;
  } else {
    mantissa = stored | F::implicit_bit_mask();
  }

  return DecomposedFloat(mantissa, exponent, sign);
}

// Decompose a double. NaN, +inf and -inf yield std::nullopt.
constexpr std::optional<DecomposedFloat> decompose(double value) {
  return decompose_bits(std::bit_cast<storage_type>(value));
}

// Bit pattern of the double a decomposed value came from
constexpr storage_type recompose_bits(const DecomposedFloat &value) {
  return detail::compose_bits(value.mantissa(), value.exponent(),
                              value.sign());
}

// Reconstruct the exact double a decomposed value came from
constexpr double recompose(const DecomposedFloat &value) {
  return std::bit_cast<double>(recompose_bits(value));
}

} // namespace fpord::inline v1
