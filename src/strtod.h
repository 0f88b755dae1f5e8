// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "exact_decimal.h"

namespace safenum {

//==================================================================================================
// DecimalToDouble
//
// Correctly rounded (round-to-nearest, ties-to-even) decimal to binary64 conversion.
//
// [1] Clinger, "How to read floating point numbers accurately",
//     PLDI '90 Proceedings of the ACM SIGPLAN 1990 conference on Programming language design and
//     implementation, Pages 92-101
//==================================================================================================

// Maximum number of significant digits in decimal representation.
//
// The longest possible double in decimal representation is (2^53 - 1) * 5^1074 / 10^1074,
// which has 767 digits.
// If we parse a number whose first digits are equal to a mean of 2 adjacent doubles (that
// could have up to 768 digits) the result must be rounded to the bigger one unless the tail
// consists of zeros, so we don't need to preserve all the digits.
constexpr int kMaxSignificantDigits = 767 + 1;

// Convert the decimal representation 'digits * 10^exponent' into an IEEE
// double-precision number.
// If nonzero_tail is true, the input is treated as 'digits' followed by further
// digits that are not all zero.
//
// PRE: digits must contain only ASCII characters in the range '0'...'9'.
// PRE: num_digits >= 0
// PRE: num_digits + exponent must not overflow.
double DecimalToDouble(char const* digits, int num_digits, int exponent, bool nonzero_tail = false);

// Returns the double nearest to the exact value of x.
// Negative zero is returned for negative zero inputs.
double ToDouble(ExactDecimal const& x);

} // namespace safenum
