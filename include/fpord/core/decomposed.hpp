#pragma once

#include <fpord/core/format.hpp>
#include <optional>
#include <type_traits>

namespace fpord::inline v1 {

class DecomposedFloat;

constexpr std::optional<DecomposedFloat> decompose_bits(storage_type bits);

// Decomposed binary64 value for exact comparison
//
// Holds the three fields of a finite double in a form where ordering can be
// decided with integer comparisons only:
//
// - mantissa: for normal values, the 52 stored bits with the explicit leading
//   bit (bit 52) set, so it lies in [2^52, 2^53). For subnormal values and
//   both zeros, the 52 stored bits shifted left by one, no leading bit.
//   Such a mantissa still reaches bit 52 when stored bit 51 is set, so only
//   the exponent distinguishes the two cases.
// - exponent: the raw 11-bit exponent field, bias not removed. 0 marks a
//   subnormal (or zero).
// - sign: true = non-negative (sign bit clear), false = negative.
//
// Values only come out of decompose()/decompose_bits(), so the exponent is
// always in [0, 2046]. Equality is field-wise, which is the same as bit
// equality of the source doubles: -0.0 and +0.0 are different values here
// and -0.0 orders below +0.0 (see operations/compare.hpp).
class DecomposedFloat final {
public:
  constexpr mantissa_type mantissa() const { return mantissa_; }
  constexpr exponent_type exponent() const { return exponent_; }
  constexpr bool sign() const { return sign_; }

  constexpr bool is_negative() const { return !sign_; }

  // Either zero. The subnormal mantissa of a zero is 0 as well.
  constexpr bool is_zero() const { return exponent_ == 0 && mantissa_ == 0; }

  constexpr bool is_subnormal() const {
    return exponent_ == 0 && mantissa_ != 0;
  }

  friend constexpr bool operator==(const DecomposedFloat &,
                                   const DecomposedFloat &) = default;

private:
  constexpr DecomposedFloat(mantissa_type mantissa, exponent_type exponent,
                            bool sign)
      : mantissa_(mantissa), exponent_(exponent), sign_(sign) {}

  friend constexpr std::optional<DecomposedFloat>
  decompose_bits(storage_type bits);

  mantissa_type mantissa_;
  exponent_type exponent_;
  bool sign_;
};

static_assert(std::is_trivially_copyable_v<DecomposedFloat>,
              "DecomposedFloat is a plain value type");

} // namespace fpord::inline v1
