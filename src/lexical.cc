// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "lexical.h"

using namespace safenum;

static inline bool IsDigit(char ch)
{
    return '0' <= ch && ch <= '9';
}

LexicalStatus safenum::ScanDecimal(char const* first, char const* last, DecimalSpan& span)
{
    char const* curr = first;

    if (curr == last)
        return LexicalStatus::empty;

    bool const negative = (*curr == '-');
    if (negative)
    {
        ++curr;
        if (curr == last)
            return LexicalStatus::missing_integer_digits;
    }

    if (*curr == '.')
        return LexicalStatus::missing_integer_digits;
    if (!IsDigit(*curr))
        return LexicalStatus::invalid_character;

    char const* const integer_first = curr;
    if (*curr == '0')
    {
        ++curr;
        if (curr != last && IsDigit(*curr))
            return LexicalStatus::leading_zero;
    }
    else
    {
        for (++curr; curr != last && IsDigit(*curr); ++curr)
        {
        }
    }
    char const* const integer_last = curr;

    char const* fraction_first = curr;
    char const* fraction_last = curr;
    if (curr != last)
    {
        if (*curr != '.')
            return LexicalStatus::invalid_character;

        ++curr;
        if (curr == last)
            return LexicalStatus::missing_fraction_digits;
        if (!IsDigit(*curr))
            return LexicalStatus::invalid_character;

        fraction_first = curr;
        for (++curr; curr != last && IsDigit(*curr); ++curr)
        {
        }
        fraction_last = curr;

        if (curr != last)
            return LexicalStatus::invalid_character;
    }

    span.negative       = negative;
    span.integer_first  = integer_first;
    span.integer_last   = integer_last;
    span.fraction_first = fraction_first;
    span.fraction_last  = fraction_last;

    return LexicalStatus::ok;
}

bool safenum::IsValidDecimal(char const* first, char const* last)
{
    DecimalSpan span;
    return ScanDecimal(first, last, span) == LexicalStatus::ok;
}

char const* safenum::LexicalStatusName(LexicalStatus status)
{
    switch (status)
    {
    case LexicalStatus::ok:
        return "ok";
    case LexicalStatus::empty:
        return "empty";
    case LexicalStatus::missing_integer_digits:
        return "missing integer digits";
    case LexicalStatus::leading_zero:
        return "leading zero";
    case LexicalStatus::missing_fraction_digits:
        return "missing fraction digits";
    case LexicalStatus::invalid_character:
        return "invalid character";
    }

    return "unknown";
}
