#include <bit>
#include <limits>
#include <fpord/c_api.h>
#include <fpord/fpord.hpp>

using namespace fpord;

namespace {

int to_c_ordering(std::strong_ordering ord) {
  if (ord < 0) {
    return -1;
  }
  if (ord > 0) {
    return 1;
  }
  return 0;
}

} // namespace

extern "C" {

bool FPORD_C_NAME(decompose)(double value, struct fpord_decomposed *out) {
  if (out == nullptr) {
    return false;
  }

  auto decomposed = decompose(value);
  if (!decomposed) {
    return false;
  }

  out->mantissa = decomposed->mantissa();
  out->exponent = decomposed->exponent();
  out->sign = decomposed->sign();
  return true;
}

double FPORD_C_NAME(recompose)(const struct fpord_decomposed *value) {
  if (value == nullptr) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return std::bit_cast<double>(
      detail::compose_bits(value->mantissa, value->exponent, value->sign));
}

int FPORD_C_NAME(compare)(const struct fpord_decomposed *a,
                          const struct fpord_decomposed *b) {
  if (a == nullptr || b == nullptr) {
    return (a != nullptr) - (b != nullptr);
  }
  return to_c_ordering(detail::compare_fields(a->mantissa, a->exponent,
                                              a->sign, b->mantissa,
                                              b->exponent, b->sign));
}

int FPORD_C_NAME(compare_values)(double a, double b, int *result) {
  auto ord = compare_values(a, b);
  if (!ord) {
    return -1;
  }
  if (result != nullptr) {
    *result = to_c_ordering(*ord);
  }
  return 0;
}

} // extern "C"
