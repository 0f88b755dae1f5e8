// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "dragon4.h"

#include "diy_int.h"
#include "ieee.h"

#include <cstring>

using namespace safenum;
using namespace safenum::impl;

//==================================================================================================
// Dragon4
//==================================================================================================

// Returns: x / 2^n, rounded towards -infinity.
static inline int SAR(int x, int n)
{
    // Technically, right-shift of negative integers is implementation defined...
    // Should easily get optimized into SAR (or equivalent) instruction.
#if 1
    return x < 0 ? ~(~x >> n) : (x >> n);
#else
    return x >> n;
#endif
}

// Returns: ceil(log_10(2^e))
static inline int CeilLog10Pow2(int e)
{
    SAFENUM_ASSERT(e >= -2620);
    SAFENUM_ASSERT(e <=  2620);
    return SAR(e * 315653 + ((1 << 20) - 1), 20);
}

static inline int EffectivePrecision(uint64_t f)
{
    SAFENUM_ASSERT(f != 0);
    return 64 - CountLeadingZeros64(f);
}

// Computes r, s, m- and m+ such that
//
//      v / 10^k = r / s,   m- / s = (v - v-) / 2 / 10^k,   m+ / s = (v+ - v) / 2 / 10^k
//
// where k is an estimate for ceil(log_10(v)), which is either correct or one too low.
static int ComputeInitialValuesAndEstimate(DiyInt& r, DiyInt& s, DiyInt& m_minus, DiyInt& m_plus, uint64_t f, int e, bool lower_boundary_is_closer)
{
    int const boundary_shift = lower_boundary_is_closer ? 2 : 1;
    int const p = EffectivePrecision(f);
    SAFENUM_ASSERT(p >= 1);
    SAFENUM_ASSERT(p <= 53);
    int const k = CeilLog10Pow2(e + (p - 1));

    if (e >= 0)
    {
        SAFENUM_ASSERT(e <= 971);
        SAFENUM_ASSERT(k >= 0);
        SAFENUM_ASSERT(k <= 308);

        // r = f * 2^(boundary_shift + e)
        AssignU64MulPow2(r, f << boundary_shift, e);
        // s = 2^boundary_shift * 10^k
        AssignPow2MulPow5(s, boundary_shift + k, k);
        // m- = 2^e
        AssignPow2(m_minus, e);
        AssignPow2(m_plus, e);
    }
    else if (k < 0)
    {
        SAFENUM_ASSERT(e >= -1074);
        SAFENUM_ASSERT(k >= -323);

        // r = f * 2^boundary_shift * 10^(-k)
        AssignU64MulPow10(r, f << boundary_shift, -k);
        // s = 2^(boundary_shift - e)
        AssignPow2(s, boundary_shift - e);
        // m- = 10^(-k)
        AssignPow10(m_minus, -k);
        AssignPow10(m_plus, -k);
    }
    else
    {
        SAFENUM_ASSERT(e >= -55);
        SAFENUM_ASSERT(k <= 16);

        // r = f * 2^boundary_shift
        AssignU64(r, f << boundary_shift);
        // s = 2^(boundary_shift - e) * 10^k
        AssignPow2MulPow5(s, boundary_shift - e + k, k);
        // m- = 1
        AssignU32(m_minus, 1);
        AssignU32(m_plus, 1);
    }

    // The gap to the next larger double is twice the gap to the next smaller double.
    if (lower_boundary_is_closer)
    {
        Mul2(m_plus);
    }

    return k;
}

char* safenum::impl::Dragon4(char* digits, int& num_digits, int& exponent, uint64_t f, int e, bool accept_bounds, bool lower_boundary_is_closer)
{
    SAFENUM_ASSERT(f != 0);

    DiyInt r;
    DiyInt s;
    DiyInt m_minus;
    DiyInt m_plus;

    //
    // Compute initial values.
    // Estimate k.
    //
    int k = ComputeInitialValuesAndEstimate(r, s, m_minus, m_plus, f, e, lower_boundary_is_closer);

    //
    // Fixup, in case k is too low.
    //
    int const cmpf = CompareAdd(r, m_plus, s);
    if (accept_bounds ? (cmpf >= 0) : (cmpf > 0))
    {
        Mul10(s);
        k++;
    }

    //
    // Generate digits from left to right.
    //
    Mul10(r);
    Mul10(m_minus);
    Mul10(m_plus);

    int length = 0;
    for (;;)
    {
        SAFENUM_ASSERT(length < 17);
        SAFENUM_ASSERT(r.size > 0);

        // q = r / s
        // r = r % s
        uint32_t q = DivMod(r, s);
        SAFENUM_ASSERT(q <= 9);

        int const cmp1 = Compare(r, m_minus);
        int const cmp2 = CompareAdd(r, m_plus, s);

        bool const tc1 = accept_bounds ? (cmp1 <= 0) : (cmp1 < 0);
        bool const tc2 = accept_bounds ? (cmp2 >= 0) : (cmp2 > 0);
        if (tc1 && tc2)
        {
            // Both q and q + 1 are within the rounding interval.
            // Return the one closer to v, or the even one if v is exactly in the middle.
            int const cmpr = CompareAdd(r, r, s);
            if (cmpr > 0 || (cmpr == 0 && q % 2 != 0))
            {
                q++;
            }
        }
        else if (!tc1 && tc2)
        {
            q++;
        }

        SAFENUM_ASSERT(q <= 9);
        digits[length++] = static_cast<char>(q + '0');
        k--;

        if (tc1 || tc2)
            break;

        Mul10(r);
        Mul10(m_minus);
        Mul10(m_plus);
    }

    num_digits = length;
    exponent = k;

    return digits + length;
}

//==================================================================================================
// ToShortestDigits
//==================================================================================================

void safenum::ToShortestDigits(char* buffer, int& num_digits, int& exponent, double value)
{
    SAFENUM_ASSERT(IEEEDouble(value).IsFinite());
    SAFENUM_ASSERT(value > 0);

    auto const v = DiyFpFromDouble(value);

    bool const is_even = (v.f % 2 == 0);
    bool const accept_bounds = is_even;
    bool const lower_boundary_is_closer = LowerBoundaryIsCloser(value);

    Dragon4(buffer, num_digits, exponent, v.f, v.e, accept_bounds, lower_boundary_is_closer);

    SAFENUM_ASSERT(num_digits > 0);
    SAFENUM_ASSERT(num_digits <= 17);
}

ExactDecimal safenum::ToShortestDecimal(double value)
{
    IEEEDouble const v(value);
    SAFENUM_ASSERT(v.IsFinite());

    ExactDecimal result;
    result.negative = v.SignBit();

    if (v.IsZero())
        return result;

    char buffer[17];
    int num_digits = 0;
    int exponent = 0;
    ToShortestDigits(buffer, num_digits, exponent, v.AbsValue());

    result.digits.assign(buffer, buffer + num_digits);
    result.point_position = num_digits + exponent;

    return result;
}

//==================================================================================================
// Dtoa
//==================================================================================================

static inline void Utoa_2Digits(char* buf, uint32_t digits)
{
    static constexpr char const* kDigits100 =
        "00010203040506070809"
        "10111213141516171819"
        "20212223242526272829"
        "30313233343536373839"
        "40414243444546474849"
        "50515253545556575859"
        "60616263646566676869"
        "70717273747576777879"
        "80818283848586878889"
        "90919293949596979899";

    SAFENUM_ASSERT(digits < 100);
    std::memcpy(buf, kDigits100 + 2 * digits, 2);
}

// Appends a decimal representation of 'value' to buffer.
// Returns a pointer to the element following the digits.
//
// PRE: -1000 < value < 1000
static char* ExponentToString(char* buffer, int value)
{
    SAFENUM_ASSERT(value > -1000);
    SAFENUM_ASSERT(value <  1000);

    int n = 0;

    if (value < 0)
    {
        buffer[n++] = '-';
        value = -value;
    }
    else
    {
        buffer[n++] = '+';
    }

    uint32_t const k = static_cast<uint32_t>(value);
    if (k < 10)
    {
        buffer[n++] = static_cast<char>('0' + k);
    }
    else if (k < 100)
    {
        Utoa_2Digits(buffer + n, k);
        n += 2;
    }
    else
    {
        uint32_t const r = k % 10;
        uint32_t const q = k / 10;
        Utoa_2Digits(buffer + n, q);
        n += 2;
        buffer[n++] = static_cast<char>('0' + r);
    }

    return buffer + n;
}

static char* FormatFixed(char* buffer, int num_digits, int decimal_point)
{
    SAFENUM_ASSERT(buffer != nullptr);
    SAFENUM_ASSERT(num_digits >= 1);

    if (num_digits <= decimal_point)
    {
        // digits[000]
        std::memset(buffer + num_digits, '0', static_cast<size_t>(decimal_point - num_digits));
        return buffer + decimal_point;
    }
    else if (0 < decimal_point)
    {
        // dig.its
        std::memmove(buffer + (decimal_point + 1), buffer + decimal_point, static_cast<size_t>(num_digits - decimal_point));
        buffer[decimal_point] = '.';
        return buffer + (num_digits + 1);
    }
    else // decimal_point <= 0
    {
        // 0.[000]digits
        std::memmove(buffer + (2 + -decimal_point), buffer, static_cast<size_t>(num_digits));
        buffer[0] = '0';
        buffer[1] = '.';
        std::memset(buffer + 2, '0', static_cast<size_t>(-decimal_point));
        return buffer + (2 + (-decimal_point) + num_digits);
    }
}

static char* FormatExponential(char* buffer, int num_digits, int exponent)
{
    SAFENUM_ASSERT(buffer != nullptr);
    SAFENUM_ASSERT(num_digits >= 1);

    if (num_digits == 1)
    {
        // de+123
        buffer += 1;
    }
    else
    {
        // d.igitse+123
        std::memmove(buffer + 2, buffer + 1, static_cast<size_t>(num_digits - 1));
        buffer[1] = '.';
        buffer += 1 + num_digits;
    }

    buffer[0] = 'e';
    return ExponentToString(buffer + 1, exponent);
}

char* safenum::Dtoa(char* next, char* last, double value)
{
    SAFENUM_ASSERT(last - next >= kDtoaMaxLength);
    static_cast<void>(last);

    IEEEDouble const v(value);

    if (!v.IsFinite())
    {
        if (v.IsNaN())
        {
            std::memcpy(next, "NaN", 3);
            return next + 3;
        }
        if (v.SignBit())
        {
            *next++ = '-';
        }
        std::memcpy(next, "Infinity", 8);
        return next + 8;
    }

    // ECMAScript prints negative zero as "0".
    if (v.IsZero())
    {
        *next++ = '0';
        return next;
    }

    if (v.SignBit())
    {
        *next++ = '-';
    }

    int num_digits = 0;
    int exponent = 0;
    ToShortestDigits(next, num_digits, exponent, v.AbsValue());

    int const decimal_point = num_digits + exponent;

    // These are the values used by JavaScript's ToString applied to Number type.
    constexpr int kMinExp = -6;
    constexpr int kMaxExp = 21;

    bool const use_fixed = kMinExp < decimal_point && decimal_point <= kMaxExp;

    return use_fixed
        ? FormatFixed(next, num_digits, decimal_point)
        : FormatExponential(next, num_digits, decimal_point - 1);
}
