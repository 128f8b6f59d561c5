#pragma once

// Symbol prefix for the C interface in fpord/c_api.h
// Every exported function is named FPORD_C_PREFIX followed by the operation,
// e.g. __fpord_decompose. Define FPORD_C_PREFIX before including c_api.h (and
// when building fpord_c) to avoid clashes with another copy of the library.

#ifndef FPORD_C_PREFIX
#define FPORD_C_PREFIX __fpord_
#endif

// Token pasting
#define FPORD_CONCAT_IMPL(a, b) a##b
#define FPORD_CONCAT(a, b) FPORD_CONCAT_IMPL(a, b)
#define FPORD_C_NAME(name) FPORD_CONCAT(FPORD_C_PREFIX, name)
