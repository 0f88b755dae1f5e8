// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <climits>
#include <string>

namespace safenum {

//==================================================================================================
// IsSafeNumeric
//
// A string is a safe numeric string if it is a plain decimal numeral
// (see lexical.h) whose value survives the trip
//
//      decimal --(round to nearest double)--> binary64 --(shortest decimal)--> decimal
//
// without any change in value, and whose integer part does not exceed 2^53 - 1.
// E.g. "0.1", "-0.123" and "9007199254740991" are safe, while "9007199254740993",
// "0.1234567890123456789" and "1e5" are not.
//==================================================================================================

enum class SafeNumericStatus {
    safe,
    not_a_string,             // null pointer
    empty,
    missing_integer_digits,
    leading_zero,
    missing_fraction_digits,
    invalid_character,
    input_too_long,
    exceeds_max_safe_integer,
    inexact_round_trip,
};

// Longer inputs are rejected with SafeNumericStatus::input_too_long.
// This keeps all decimal exponents well within the range of an int.
constexpr int kMaxInputLength = INT_MAX / 4;

SafeNumericStatus CheckSafeNumeric(char const* first, char const* last);

bool IsSafeNumeric(char const* first, char const* last);
bool IsSafeNumeric(std::string const& str);

// A null pointer is not a string and yields false.
bool IsSafeNumeric(char const* c_str);

char const* SafeNumericStatusName(SafeNumericStatus status);

} // namespace safenum
