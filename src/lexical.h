// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

namespace safenum {

//==================================================================================================
// Lexical validation
//
// Accepts exactly the plain decimal numerals
//
//      decimal  = [ "-" ] integer [ "." digit { digit } ]
//      integer  = "0" | nonzero { digit }
//
// No whitespace, no "+", no exponent, no separators and only ASCII digits.
//==================================================================================================

enum class LexicalStatus {
    ok,
    empty,
    missing_integer_digits,  // "-", ".5", "-.5"
    leading_zero,            // "00", "0123"
    missing_fraction_digits, // "1.", "-0."
    invalid_character,       // " 1", "1e5", "+1", "1.2.3", "0x1F"
};

// The parts of a lexically valid decimal numeral.
// Both digit ranges point into the scanned input.
struct DecimalSpan
{
    bool        negative = false;
    char const* integer_first = nullptr;
    char const* integer_last = nullptr;
    char const* fraction_first = nullptr; // empty range if there is no fractional part
    char const* fraction_last = nullptr;
};

// Classifies the characters [first, last).
// On success, stores the sign and the digit ranges in span.
LexicalStatus ScanDecimal(char const* first, char const* last, DecimalSpan& span);

// Returns whether [first, last) is a valid decimal numeral.
bool IsValidDecimal(char const* first, char const* last);

char const* LexicalStatusName(LexicalStatus status);

} // namespace safenum
