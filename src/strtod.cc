// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "strtod.h"

#include "diy_int.h"
#include "ieee.h"

#include <cstdint>
#include <limits>

using namespace safenum;
using namespace safenum::impl;

//--------------------------------------------------------------------------------------------------
// FastPath
//--------------------------------------------------------------------------------------------------

// Double operations detection based on target architecture.
// Linux uses a 80bit wide floating point stack on x86. This induces double rounding, which in
// turn leads to wrong results.
// An easy way to test if the floating-point operations are correct is to evaluate: 89255.0/1e22.
// If the floating-point stack is 64 bits wide then the result is equal to 89255e-22.
#ifndef SAFENUM_CORRECT_DOUBLE_OPERATIONS
#if defined(_M_X64)              || \
    defined(__x86_64__)          || \
    defined(__ARMEL__)           || \
    defined(__aarch64__)         || \
    defined(__AARCH64EL__)       || \
    defined(__powerpc__)         || \
    defined(__ppc64__)           || \
    defined(__mips__)            || \
    defined(__s390__)            || \
    defined(__sparc__)           || \
    defined(__riscv)
#define SAFENUM_CORRECT_DOUBLE_OPERATIONS 1
#elif defined(_M_IX86) && defined(_WIN32)
// Windows uses a 64bit wide floating point stack.
#define SAFENUM_CORRECT_DOUBLE_OPERATIONS 1
#else
#define SAFENUM_CORRECT_DOUBLE_OPERATIONS 0
#endif
#endif

// 2^53 = 9007199254740992.
// Any integer with at most 15 decimal digits will hence fit into a double
// (which has a 53bit significand) without loss of precision.
static constexpr int kMaxExactDoubleIntegerDecimalDigits = 15;

// 2^64 = 18446744073709551616 > 10^19
// Any integer with at most 19 decimal digits will hence fit into an uint64_t.
static constexpr int kMaxUint64DecimalDigits = 19;

static constexpr int kMaxExactPowerOfTen = 22;
static constexpr double kExactPowersOfTen[] = {
    1.0e+00,
    1.0e+01,
    1.0e+02,
    1.0e+03,
    1.0e+04,
    1.0e+05,
    1.0e+06,
    1.0e+07,
    1.0e+08,
    1.0e+09,
    1.0e+10,
    1.0e+11,
    1.0e+12,
    1.0e+13,
    1.0e+14,
    1.0e+15, // 10^15 < 9007199254740992 = 2^53
    1.0e+16, // 10^16 = 5000000000000000 * 2^1  = (10^15 * 5^1 ) * 2^1
    1.0e+17, // 10^17 = 6250000000000000 * 2^4  = (10^13 * 5^4 ) * 2^4
    1.0e+18, // 10^18 = 7812500000000000 * 2^7  = (10^11 * 5^7 ) * 2^7
    1.0e+19, // 10^19 = 4882812500000000 * 2^11 = (10^8  * 5^11) * 2^11
    1.0e+20, // 10^20 = 6103515625000000 * 2^14 = (10^6  * 5^14) * 2^14
    1.0e+21, // 10^21 = 7629394531250000 * 2^17 = (10^4  * 5^17) * 2^17
    1.0e+22, // 10^22 = 4768371582031250 * 2^21 = (10^1  * 5^21) * 2^21
};

static uint64_t ReadDecimalU64(char const* first, char const* last)
{
    SAFENUM_ASSERT(last - first <= kMaxUint64DecimalDigits);

    uint64_t value = 0;
    for ( ; first != last; ++first)
    {
        SAFENUM_ASSERT('0' <= *first && *first <= '9');
        value = 10 * value + static_cast<uint64_t>(*first - '0');
    }

    return value;
}

// The significand fits into a double.
// If 10^exponent (resp. 10^-exponent) fits into a double too then we can
// compute the result simply by multiplying (resp. dividing) the two
// numbers. IEEE guarantees that these operations return the best possible
// approximation.
static bool FastPath(double& result, char const* digits, int num_digits, int exponent)
{
#if SAFENUM_CORRECT_DOUBLE_OPERATIONS
    SAFENUM_ASSERT(num_digits <= kMaxExactDoubleIntegerDecimalDigits);

    int const remaining_digits = kMaxExactDoubleIntegerDecimalDigits - num_digits; // 0 <= rd <= 15
    if (exponent < -kMaxExactPowerOfTen || exponent > remaining_digits + kMaxExactPowerOfTen)
        return false;

    double d = static_cast<double>(static_cast<int64_t>(ReadDecimalU64(digits, digits + num_digits)));
    if (exponent < 0)
    {
        d /= kExactPowersOfTen[-exponent];
    }
    else if (exponent <= kMaxExactPowerOfTen)
    {
        d *= kExactPowersOfTen[exponent];
    }
    else
    {
        // The buffer is short and we can multiply it with
        // 10^remaining_digits and the remaining exponent fits into a double.
        //
        // Eg. 123 * 10^25 = (123*1000) * 10^22
        d *= kExactPowersOfTen[remaining_digits]; // exact
        d *= kExactPowersOfTen[exponent - remaining_digits];
    }

    result = d;
    return true;
#else
    static_cast<void>(result);
    static_cast<void>(digits);
    static_cast<void>(num_digits);
    static_cast<void>(exponent);
    return false;
#endif
}

//--------------------------------------------------------------------------------------------------
// Approximation
//--------------------------------------------------------------------------------------------------

// Returns an approximation of digits * 10^exponent.
// Only the leading 19 digits are used, and each scaling step adds at most 1/2 ULP of
// error, so the result is within a few dozen ULPs of the correctly rounded double.
// The result may be +Infinity if the input is close to the largest double.
//
// PRE: num_digits > 0
// PRE: num_digits + exponent <= kMaxDecimalPower
// PRE: num_digits + exponent >  kMinDecimalPower
static double ApproximateDouble(char const* digits, int num_digits, int exponent)
{
    int const read_digits = Min(num_digits, kMaxUint64DecimalDigits);
    exponent += num_digits - read_digits;

    double d = static_cast<double>(ReadDecimalU64(digits, digits + read_digits));

    // Scale towards the final magnitude, so that no intermediate result overflows or
    // underflows before the final one does.
    while (exponent > kMaxExactPowerOfTen)
    {
        d *= kExactPowersOfTen[kMaxExactPowerOfTen];
        exponent -= kMaxExactPowerOfTen;
    }
    while (exponent < -kMaxExactPowerOfTen)
    {
        d /= kExactPowersOfTen[kMaxExactPowerOfTen];
        exponent += kMaxExactPowerOfTen;
    }

    if (exponent >= 0)
        d *= kExactPowersOfTen[exponent];
    else
        d /= kExactPowersOfTen[-exponent];

    return d;
}

//--------------------------------------------------------------------------------------------------
// Correction
//--------------------------------------------------------------------------------------------------

// Max double: 1.7976931348623157 * 10^308, which has 309 digits.
// Any x >= 10^309 is interpreted as +infinity.
static constexpr int kMaxDecimalPower = 309;

// Min non-zero double: 4.9406564584124654 * 10^-324
// Any x <= 10^-324 is interpreted as 0.
// Note that 2.5e-324 (despite being smaller than the min double) will be read
// as non-zero (equal to the min non-zero double).
static constexpr int kMinDecimalPower = -324;

// Compare B = digits * 10^exponent with v = f * 2^e.
//
// PRE: num_digits + exponent <= kMaxDecimalPower
// PRE: num_digits + exponent >  kMinDecimalPower
// PRE: num_digits            <= kMaxSignificantDigits
static int CompareBufferWithDiyFp(char const* digits, int num_digits, int exponent, bool nonzero_tail, DiyFp v)
{
    SAFENUM_ASSERT(num_digits > 0);
    SAFENUM_ASSERT(num_digits + exponent <= kMaxDecimalPower);
    SAFENUM_ASSERT(num_digits + exponent >  kMinDecimalPower);
    SAFENUM_ASSERT(num_digits            <= kMaxSignificantDigits);

    DiyInt lhs;
    DiyInt rhs;

    AssignDecimalDigits(lhs, digits, num_digits);
    if (nonzero_tail)
    {
        // Any non-zero tail lies strictly between digits and digits + 1 (in units of the
        // last digit), and so does digits.1 (the tail replaced by a single 1).
        // Neither can coincide with a boundary, which has at most 768 significant digits.
        MulAddU32(lhs, 10, 1);
        exponent--;
    }
    AssignU64(rhs, v.f);

    int lhs_exp5 = 0;
    int rhs_exp5 = 0;
    int lhs_exp2 = 0;
    int rhs_exp2 = 0;

    if (exponent >= 0)
    {
        lhs_exp5 += exponent;
        lhs_exp2 += exponent;
    }
    else
    {
        rhs_exp5 -= exponent;
        rhs_exp2 -= exponent;
    }

    if (v.e >= 0)
    {
        rhs_exp2 += v.e;
    }
    else
    {
        lhs_exp2 -= v.e;
    }

    if (lhs_exp5 > 0)
    {
        MulPow5(lhs, lhs_exp5);
    }
    else if (rhs_exp5 > 0)
    {
        MulPow5(rhs, rhs_exp5);
    }

    int const diff_exp2 = lhs_exp2 - rhs_exp2;
    if (diff_exp2 > 0)
    {
        MulPow2(lhs, diff_exp2);
    }
    else if (diff_exp2 < 0)
    {
        MulPow2(rhs, -diff_exp2);
    }

    return Compare(lhs, rhs);
}

// Moves the candidate v to the double whose rounding interval contains
// B = digits * 10^exponent. On a boundary, the double with the even significand wins.
//
// Every step moves v by one ULP towards B, so the number of steps is bounded by the
// error of the initial approximation.
static double Refine(double v, char const* digits, int num_digits, int exponent, bool nonzero_tail)
{
    SAFENUM_ASSERT(v >= 0);

    if (IEEEDouble(v).IsInf())
    {
        v = std::numeric_limits<double>::max();
    }

    for (;;)
    {
        //     v             m+            v+
        //  ---+--------+----+-------------+---
        //              B
        int const cmp_upper = CompareBufferWithDiyFp(digits, num_digits, exponent, nonzero_tail, UpperBoundary(v));
        if (cmp_upper > 0 || (cmp_upper == 0 && !SignificandIsEven(v)))
        {
            v = IEEEDouble(v).NextValue();
            if (IEEEDouble(v).IsInf())
                return v;
            continue;
        }

        if (v > 0)
        {
            //     v-            m-            v
            //  ---+-------------+----+--------+---
            //                        B
            int const cmp_lower = CompareBufferWithDiyFp(digits, num_digits, exponent, nonzero_tail, LowerBoundary(v));
            if (cmp_lower < 0 || (cmp_lower == 0 && !SignificandIsEven(v)))
            {
                v = IEEEDouble(v).PrevValue();
                continue;
            }
        }

        return v;
    }
}

//--------------------------------------------------------------------------------------------------
// DecimalToDouble
//--------------------------------------------------------------------------------------------------

double safenum::DecimalToDouble(char const* digits, int num_digits, int exponent, bool nonzero_tail)
{
    SAFENUM_ASSERT(num_digits >= 0);

    // Ignore leading zeros
    while (num_digits > 0 && digits[0] == '0')
    {
        digits++;
        num_digits--;
    }

    // Move trailing zeros into the exponent
    while (num_digits > 0 && digits[num_digits - 1] == '0')
    {
        num_digits--;
        exponent++;
    }

    if (num_digits > kMaxSignificantDigits)
    {
        SAFENUM_ASSERT(digits[num_digits - 1] != '0'); // since trailing zeros have been trimmed above.

        nonzero_tail = true;

        // Discard insignificant digits.
        exponent += num_digits - kMaxSignificantDigits;
        num_digits = kMaxSignificantDigits;
    }

    if (num_digits == 0)
    {
        return 0.0;
    }

    // Any v >= 10^309 is interpreted as +Infinity.
    if (num_digits + exponent > kMaxDecimalPower)
    {
        return std::numeric_limits<double>::infinity();
    }

    // Any v <= 10^-324 is interpreted as 0.
    if (num_digits + exponent <= kMinDecimalPower)
    {
        return 0.0;
    }

    double v;
    if (!nonzero_tail && num_digits <= kMaxExactDoubleIntegerDecimalDigits && FastPath(v, digits, num_digits, exponent))
    {
        return v;
    }

    v = ApproximateDouble(digits, num_digits, exponent);
    return Refine(v, digits, num_digits, exponent, nonzero_tail);
}

double safenum::ToDouble(ExactDecimal const& x)
{
    auto const c = Canonicalize(x);
    if (c.digits.empty())
    {
        return x.negative ? -0.0 : 0.0;
    }

    int const num_digits = static_cast<int>(c.digits.size());
    double const v = DecimalToDouble(c.digits.data(), num_digits, c.point_position - num_digits);

    return c.negative ? -v : v;
}
