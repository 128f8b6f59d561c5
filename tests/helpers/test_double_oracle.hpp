#pragma once

#include <bit>
#include <cmath>
#include <compare>
#include <cstdint>
#include <fpord/fpord.hpp>
#include <random>

namespace fpord::test_helpers {

// Native double comparison is our ORACLE: the hardware comparison is the
// reference for the real-number order. The only place the decomposed order
// is allowed to differ is the signed zero pair, where the native comparison
// says equal and the decomposed order says -0.0 < +0.0.
//
// Both inputs must be finite.
inline std::strong_ordering native_order(double a, double b) {
  if (a == 0.0 && b == 0.0) {
    bool a_neg = std::signbit(a);
    bool b_neg = std::signbit(b);
    // Negative zero first, same as the decomposed order
    return b_neg <=> a_neg;
  }
  if (a < b) {
    return std::strong_ordering::less;
  }
  if (a > b) {
    return std::strong_ordering::greater;
  }
  return std::strong_ordering::equal;
}

inline const char *ordering_name(std::strong_ordering ord) {
  if (ord < 0) {
    return "less";
  }
  if (ord > 0) {
    return "greater";
  }
  return "equal";
}

constexpr storage_type bits_of(double value) {
  return std::bit_cast<storage_type>(value);
}

constexpr double from_bits(storage_type bits) {
  return std::bit_cast<double>(bits);
}

// Exact round trip, compared on bit patterns so -0.0 != 0.0
inline bool roundtrips_exactly(double value) {
  auto decomposed = decompose(value);
  if (!decomposed) {
    return false;
  }
  return bits_of(recompose(*decomposed)) == bits_of(value);
}

// Deterministic source of finite doubles
//
// Draws random bit patterns so that every exponent (subnormals included) is
// equally likely, and rejects the all-ones exponent (infinities and NaNs).
class FiniteDoubleSource {
public:
  explicit FiniteDoubleSource(std::uint64_t seed) : engine_(seed) {}

  double next() {
    for (;;) {
      storage_type bits = engine_();
      auto exponent = (bits >> Binary64Format::exp_offset) &
                      Binary64Format::exp_field_mask;
      if (exponent != Binary64Format::exp_special) {
        return from_bits(bits);
      }
    }
  }

  // Doubles in [-1000, 1000), the range typical callers compare
  double next_moderate() {
    std::uniform_real_distribution<double> dist(-1000.0, 1000.0);
    return dist(engine_);
  }

private:
  std::mt19937_64 engine_;
};

} // namespace fpord::test_helpers
