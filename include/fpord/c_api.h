#pragma once

// C interface to FPORD
// Symbol names are FPORD_C_PREFIX followed by the operation name
// (__fpord_decompose, __fpord_compare, ... by default).

#include <fpord/core/prefix.hpp>

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#else
#include <stdbool.h>
#endif

// Decomposed binary64 value. Same field meaning as fpord::DecomposedFloat:
// sign is true for non-negative values, exponent is the raw field.
struct fpord_decomposed {
  uint64_t mantissa;
  int16_t exponent;
  bool sign;
};

// Returns false for NaN, infinities, or a null out; out is left untouched
bool FPORD_C_NAME(decompose)(double value, struct fpord_decomposed *out);

// A null value has no double to give back: returns a quiet NaN
double FPORD_C_NAME(recompose)(const struct fpord_decomposed *value);

// Negative, zero or positive as a orders before, equal to or after b.
// A null argument orders before every value; two nulls compare equal.
int FPORD_C_NAME(compare)(const struct fpord_decomposed *a,
                          const struct fpord_decomposed *b);

// Returns 0 and writes *result (as compare) when both inputs are finite,
// -1 when either is NaN or infinite
int FPORD_C_NAME(compare_values)(double a, double b, int *result);

#ifdef __cplusplus
} // extern "C"
#endif
