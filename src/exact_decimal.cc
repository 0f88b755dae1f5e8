// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "exact_decimal.h"

#include "ieee.h"

#include <climits>

using namespace safenum;

// 2^53 - 1
static constexpr char kMaxSafeIntegerDigits[] = "9007199254740991";
static constexpr int kMaxSafeIntegerLength = static_cast<int>(sizeof(kMaxSafeIntegerDigits) - 1);

LexicalStatus safenum::ParseExactDecimal(char const* first, char const* last, ExactDecimal& result)
{
    DecimalSpan span;

    auto const status = ScanDecimal(first, last, span);
    if (status != LexicalStatus::ok)
        return status;

    auto const num_integer_digits = span.integer_last - span.integer_first;
    SAFENUM_ASSERT(num_integer_digits > 0);
    SAFENUM_ASSERT(num_integer_digits <= INT_MAX);

    result.negative = span.negative;
    result.digits.assign(span.integer_first, span.integer_last);
    result.digits.append(span.fraction_first, span.fraction_last);
    result.point_position = static_cast<int>(num_integer_digits);

    return LexicalStatus::ok;
}

ExactDecimal safenum::Canonicalize(ExactDecimal const& x)
{
    auto const first = x.digits.find_first_not_of('0');
    if (first == std::string::npos)
        return ExactDecimal{};

    auto const last = x.digits.find_last_not_of('0') + 1;

    ExactDecimal result;
    result.negative = x.negative;
    result.digits.assign(x.digits, first, last - first);
    // Each leading zero moves the decimal point one position to the left.
    result.point_position = x.point_position - static_cast<int>(first);

    return result;
}

bool safenum::IsZero(ExactDecimal const& x)
{
    return x.digits.find_first_not_of('0') == std::string::npos;
}

int safenum::Compare(ExactDecimal const& lhs, ExactDecimal const& rhs)
{
    auto const x = Canonicalize(lhs);
    auto const y = Canonicalize(rhs);

    bool const x_zero = x.digits.empty();
    bool const y_zero = y.digits.empty();

    if (x_zero && y_zero)
        return 0;

    // x < 0 <= y, y < 0 <= x, or one of them is zero.
    int const x_sign = x_zero ? 0 : (x.negative ? -1 : +1);
    int const y_sign = y_zero ? 0 : (y.negative ? -1 : +1);
    if (x_sign != y_sign)
        return x_sign < y_sign ? -1 : +1;

    // Same sign, both non-zero. With a non-zero leading digit,
    // 10^(p-1) <= |value| < 10^p.
    int cmp = 0;
    if (x.point_position != y.point_position)
    {
        cmp = x.point_position < y.point_position ? -1 : +1;
    }
    else
    {
        // Lexicographic order is numeric order here: a proper prefix is the smaller value.
        int const c = x.digits.compare(y.digits);
        cmp = (c < 0) ? -1 : ((c > 0) ? +1 : 0);
    }

    return x_sign < 0 ? -cmp : cmp;
}

bool safenum::ExceedsMaxSafeInteger(ExactDecimal const& x)
{
    auto const c = Canonicalize(x);

    int const num_integer_digits = c.point_position;
    if (num_integer_digits < kMaxSafeIntegerLength)
        return false;
    if (num_integer_digits > kMaxSafeIntegerLength)
        return true;

    // Same number of integer digits. Missing digits are trailing zeros.
    for (int i = 0; i < kMaxSafeIntegerLength; ++i)
    {
        char const d = static_cast<size_t>(i) < c.digits.size() ? c.digits[static_cast<size_t>(i)] : '0';
        if (d != kMaxSafeIntegerDigits[i])
            return d > kMaxSafeIntegerDigits[i];
    }

    return false;
}

std::string safenum::ToString(ExactDecimal const& x)
{
    auto const c = Canonicalize(x);
    if (c.digits.empty())
        return "0";

    int const length = static_cast<int>(c.digits.size());
    int const decimal_point = c.point_position;

    std::string str;
    if (c.negative)
        str += '-';

    if (length <= decimal_point)
    {
        // digits[000]
        str += c.digits;
        str.append(static_cast<size_t>(decimal_point - length), '0');
    }
    else if (0 < decimal_point)
    {
        // dig.its
        str.append(c.digits, 0, static_cast<size_t>(decimal_point));
        str += '.';
        str.append(c.digits, static_cast<size_t>(decimal_point), std::string::npos);
    }
    else
    {
        // 0.[000]digits
        str += "0.";
        str.append(static_cast<size_t>(-decimal_point), '0');
        str += c.digits;
    }

    return str;
}
