#pragma once

// FPORD - exact total ordering of decomposed binary64 values
// Main convenience header

#include <fpord/core/decomposed.hpp>
#include <fpord/core/format.hpp>
#include <fpord/core/types.hpp>
#include <fpord/operations/compare.hpp>
#include <fpord/operations/decompose.hpp>
