// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "exact_decimal.h"

#include <cstdint>

namespace safenum {

//==================================================================================================
// Dragon4
//
// Implements the Dragon4 algorithm for (IEEE) binary to decimal floating-point conversion,
// in its free-format (shortest) variant.
//
// [1] Steele, White, "How to Print Floating-Point Numbers Accurately",
//     PLDI '90 Proceedings of the ACM SIGPLAN 1990 conference on Programming language design and
//     implementation, Pages 112-126
// [2] Burger, Dybvig, "Printing Floating-Point Numbers Quickly and Accurately",
//     PLDI '96 Proceedings of the ACM SIGPLAN 1996 conference on Programming language design and
//     implementation, Pages 108-116
//==================================================================================================

namespace impl {

// Generates the shortest decimal digit string d[0]...d[n-1] such that
// d * 10^exponent lies in the rounding interval of v = f * 2^e.
// If there are multiple candidates, the one closest to v is chosen; exact
// ties are broken towards the even digit.
//
// PRE: f > 0
// PRE: the buffer must hold at least 17 characters.
char* Dragon4(char* digits, int& num_digits, int& exponent, uint64_t f, int e, bool accept_bounds, bool lower_boundary_is_closer);

} // namespace impl

// v = digits * 10^exponent
// num_digits is the length of the buffer (number of decimal digits)
//
// PRE: The buffer must be large enough, i.e. >= 17.
// PRE: value must be finite and strictly positive.
void ToShortestDigits(char* buffer, int& num_digits, int& exponent, double value);

// Returns the shortest decimal which converts back to value.
// This is the digit string ECMAScript's Number::toString produces, as an exact decimal.
//
// PRE: value must be finite.
ExactDecimal ToShortestDecimal(double value);

// Maximum number of characters Dtoa writes, e.g. "-0.0000012345678901234567".
constexpr int kDtoaMaxLength = 25;

// Generates the ECMAScript representation of value in [next, last), i.e. the
// string String(value) returns in JavaScript. The result is not null-terminated.
// Returns a pointer to the element following the last character.
//
// PRE: last - next >= kDtoaMaxLength
char* Dtoa(char* next, char* last, double value);

} // namespace safenum
