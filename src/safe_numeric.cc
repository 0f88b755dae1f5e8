// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "safe_numeric.h"

#include "dragon4.h"
#include "exact_decimal.h"
#include "ieee.h"
#include "strtod.h"

#include <cstring>

using namespace safenum;

static SafeNumericStatus FromLexicalStatus(LexicalStatus status)
{
    switch (status)
    {
    case LexicalStatus::ok:
        return SafeNumericStatus::safe;
    case LexicalStatus::empty:
        return SafeNumericStatus::empty;
    case LexicalStatus::missing_integer_digits:
        return SafeNumericStatus::missing_integer_digits;
    case LexicalStatus::leading_zero:
        return SafeNumericStatus::leading_zero;
    case LexicalStatus::missing_fraction_digits:
        return SafeNumericStatus::missing_fraction_digits;
    case LexicalStatus::invalid_character:
        return SafeNumericStatus::invalid_character;
    }

    return SafeNumericStatus::invalid_character;
}

SafeNumericStatus safenum::CheckSafeNumeric(char const* first, char const* last)
{
    if (first == nullptr)
        return SafeNumericStatus::not_a_string;

    SAFENUM_ASSERT(first <= last);
    if (last - first > kMaxInputLength)
        return SafeNumericStatus::input_too_long;

    ExactDecimal input;
    auto const lexical_status = ParseExactDecimal(first, last, input);
    if (lexical_status != LexicalStatus::ok)
        return FromLexicalStatus(lexical_status);

    if (ExceedsMaxSafeInteger(input))
        return SafeNumericStatus::exceeds_max_safe_integer;

    double const value = ToDouble(input);
    // Unreachable with the bound above, but the formatter requires a finite value.
    if (!IEEEDouble(value).IsFinite())
        return SafeNumericStatus::exceeds_max_safe_integer;

    auto const output = ToShortestDecimal(value);
    if (input != output)
        return SafeNumericStatus::inexact_round_trip;

    return SafeNumericStatus::safe;
}

bool safenum::IsSafeNumeric(char const* first, char const* last)
{
    return CheckSafeNumeric(first, last) == SafeNumericStatus::safe;
}

bool safenum::IsSafeNumeric(std::string const& str)
{
    return IsSafeNumeric(str.data(), str.data() + str.size());
}

bool safenum::IsSafeNumeric(char const* c_str)
{
    if (c_str == nullptr)
        return false;

    return IsSafeNumeric(c_str, c_str + std::strlen(c_str));
}

char const* safenum::SafeNumericStatusName(SafeNumericStatus status)
{
    switch (status)
    {
    case SafeNumericStatus::safe:
        return "safe";
    case SafeNumericStatus::not_a_string:
        return "not a string";
    case SafeNumericStatus::empty:
        return "empty";
    case SafeNumericStatus::missing_integer_digits:
        return "missing integer digits";
    case SafeNumericStatus::leading_zero:
        return "leading zero";
    case SafeNumericStatus::missing_fraction_digits:
        return "missing fraction digits";
    case SafeNumericStatus::invalid_character:
        return "invalid character";
    case SafeNumericStatus::input_too_long:
        return "input too long";
    case SafeNumericStatus::exceeds_max_safe_integer:
        return "exceeds max safe integer";
    case SafeNumericStatus::inexact_round_trip:
        return "inexact round trip";
    }

    return "unknown";
}
