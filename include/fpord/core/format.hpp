#pragma once

#include <fpord/core/types.hpp>
#include <limits>

namespace fpord::inline v1 {

// Layout descriptor for IEEE 754 binary64 (double precision)
// Bit layout: [Sign:1 (bit 63)][Exponent:11 (bits 62-52)][Mantissa:52 (LSB)]
struct Binary64Format {
  static constexpr int sign_bits = 1;
  static constexpr int sign_offset = 63;
  static constexpr int exp_bits = 11;
  static constexpr int exp_offset = 52;
  static constexpr int mant_bits = 52;
  static constexpr int mant_offset = 0;
  static constexpr int total_bits = 64;
  static constexpr bool has_implicit_bit = true;

  // Bias is informational only: decomposed exponents are kept raw
  static constexpr int exp_bias = (1 << (exp_bits - 1)) - 1;

  // Exponent field value reserved for infinities and NaNs
  static constexpr int exp_special = (1 << exp_bits) - 1;

  static constexpr storage_type sign_mask = storage_type{1} << sign_offset;
  static constexpr storage_type exp_field_mask =
      (storage_type{1} << exp_bits) - 1;
  static constexpr storage_type mant_mask = (storage_type{1} << mant_bits) - 1;

  // Position of the explicit leading bit in a normal decomposed mantissa
  static constexpr int implicit_bit_position() { return mant_bits; }

  static constexpr mantissa_type implicit_bit_mask() {
    return mantissa_type{1} << implicit_bit_position();
  }

  // Helper: Check if this is standard IEEE 754 layout (no padding)
  static constexpr bool is_standard_layout() {
    return sign_offset == exp_offset + exp_bits &&
           exp_offset == mant_offset + mant_bits && mant_offset == 0 &&
           total_bits == sign_bits + exp_bits + mant_bits;
  }

  // Compile-time validation against the host double
  static_assert(std::numeric_limits<double>::is_iec559,
                "double must be IEEE 754 binary64");
  static_assert(std::numeric_limits<double>::digits == mant_bits + 1,
                "double must carry a 53-bit significand");
  static_assert(sizeof(double) * 8 == total_bits, "double must be 64 bits");
  static_assert(sizeof(storage_type) * 8 == total_bits,
                "Storage type must match the format width");
  static_assert(std::numeric_limits<exponent_type>::max() >= exp_special,
                "Exponent type must hold the full exponent field");
};

static_assert(Binary64Format::is_standard_layout(),
              "binary64 has no padding bits");

} // namespace fpord::inline v1
