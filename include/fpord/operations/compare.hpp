#pragma once

#include <compare>
#include <fpord/operations/decompose.hpp>

namespace fpord::inline v1 {

namespace detail {

// Order two raw decomposed triples
//
// Sign first (negative before non-negative). For non-negative values a larger
// exponent, then a larger mantissa, is a larger value. For negative values
// both comparisons are reversed. Exponent is compared before mantissa, which
// is valid across the subnormal/normal boundary because every subnormal has
// exponent 0 and every normal has exponent >= 1.
constexpr std::strong_ordering compare_fields(mantissa_type a_mantissa,
                                              exponent_type a_exponent,
                                              bool a_sign,
                                              mantissa_type b_mantissa,
                                              exponent_type b_exponent,
                                              bool b_sign) {
  if (a_sign != b_sign) {
    return a_sign ? std::strong_ordering::greater : std::strong_ordering::less;
  }

  if (a_sign) {
    if (a_exponent != b_exponent) {
      return a_exponent <=> b_exponent;
    }
    return a_mantissa <=> b_mantissa;
  }

  if (a_exponent != b_exponent) {
    return b_exponent <=> a_exponent;
  }
  return b_mantissa <=> a_mantissa;
}

} // namespace detail

// Total order over decomposed values
//
// Consistent with the real-number order of the source doubles, with one
// exception: -0.0 orders strictly below +0.0, whereas native comparison
// treats them as equal. This keeps the order antisymmetric with respect to
// the field-wise operator== (std::strong_ordering::equal implies identical
// bit patterns).
constexpr std::strong_ordering compare(const DecomposedFloat &a,
                                       const DecomposedFloat &b) {
  return detail::compare_fields(a.mantissa(), a.exponent(), a.sign(),
                                b.mantissa(), b.exponent(), b.sign());
}

constexpr std::strong_ordering operator<=>(const DecomposedFloat &a,
                                           const DecomposedFloat &b) {
  return compare(a, b);
}

// Compare two doubles through their decomposition
// std::nullopt if either one is NaN or infinite (incomparable).
constexpr std::optional<std::strong_ordering> compare_values(double a,
                                                             double b) {
  auto da = decompose(a);
  auto db = decompose(b);
  if (!da || !db) {
    return std::nullopt;
  }
  return compare(*da, *db);
}

// Comparator for ordered containers and algorithms
struct total_less {
  constexpr bool operator()(const DecomposedFloat &a,
                            const DecomposedFloat &b) const {
    return compare(a, b) < 0;
  }
};

} // namespace fpord::inline v1
