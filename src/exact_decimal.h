// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "lexical.h"

#include <string>

namespace safenum {

//==================================================================================================
// ExactDecimal
//
// A decimal numeral of arbitrary length, kept without any rounding:
//
//      value = (-1)^negative * 0.d[0]d[1]...d[n-1] * 10^point_position
//
// E.g. "-12.5" is {true, "125", 2} and "0.0012" is {false, "00012", 1}, which is equal
// in value to its canonical form {false, "12", -2}.
//==================================================================================================

struct ExactDecimal
{
    bool        negative = false;
    std::string digits;             // '0'...'9', possibly with leading or trailing zeros
    int         point_position = 0;
};

// Parses the decimal numeral [first, last) into result without loss of precision.
// Returns the status of the lexical validation; result is left unchanged unless the
// status is LexicalStatus::ok.
LexicalStatus ParseExactDecimal(char const* first, char const* last, ExactDecimal& result);

// Returns x with leading and trailing zeros removed.
// Zero is represented by an empty digit string, a zero point position and a positive sign.
ExactDecimal Canonicalize(ExactDecimal const& x);

bool IsZero(ExactDecimal const& x);

// Compares the exact values of lhs and rhs.
// Returns -1, 0 or +1. Both zeros compare equal.
int Compare(ExactDecimal const& lhs, ExactDecimal const& rhs);

inline bool operator==(ExactDecimal const& lhs, ExactDecimal const& rhs) { return Compare(lhs, rhs) == 0; }
inline bool operator!=(ExactDecimal const& lhs, ExactDecimal const& rhs) { return Compare(lhs, rhs) != 0; }

// Returns whether |integer part of x| > 2^53 - 1 = 9007199254740991.
// Compares digits only; no floating-point arithmetic is involved.
bool ExceedsMaxSafeInteger(ExactDecimal const& x);

// Returns the canonical value of x in positional notation, e.g. "-0.0012" or "1200".
std::string ToString(ExactDecimal const& x);

} // namespace safenum
