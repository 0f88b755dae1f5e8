// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cassert>
#include <cstdint>
#include <cstring>
#include <limits>

#ifndef SAFENUM_ASSERT
#define SAFENUM_ASSERT(X) assert(X)
#endif

namespace safenum {

template <typename Dest, typename Source>
inline Dest ReinterpretBits(Source source)
{
    static_assert(sizeof(Dest) == sizeof(Source), "size mismatch");

    Dest dest;
    std::memcpy(&dest, &source, sizeof(Source));
    return dest;
}

struct IEEEDouble
{
    static_assert(std::numeric_limits<double>::is_iec559 &&
                  std::numeric_limits<double>::digits == 53 &&
                  std::numeric_limits<double>::max_exponent == 1024,
        "IEEE-754 double-precision implementation required");

    using bits_type = uint64_t;

    static constexpr int       SignificandSize         = std::numeric_limits<double>::digits; // = p   (includes the hidden bit)
    static constexpr int       PhysicalSignificandSize = SignificandSize - 1;                 // = p-1 (excludes the hidden bit)
    static constexpr int       ExponentBias            = std::numeric_limits<double>::max_exponent - 1 + (SignificandSize - 1);
    static constexpr int       MaxExponent             = std::numeric_limits<double>::max_exponent - 1 - (SignificandSize - 1);
    static constexpr int       MinExponent             = std::numeric_limits<double>::min_exponent - 1 - (SignificandSize - 1);
    static constexpr bits_type HiddenBit               = bits_type{1} << (SignificandSize - 1); // = 2^(p-1)
    static constexpr bits_type SignificandMask         = HiddenBit - 1;                         // = 2^(p-1) - 1
    static constexpr bits_type ExponentMask            = bits_type{2 * std::numeric_limits<double>::max_exponent - 1} << PhysicalSignificandSize;
    static constexpr bits_type SignMask                = ~(~bits_type{0} >> 1);

    bits_type bits;

    explicit IEEEDouble(bits_type bits_) : bits(bits_) {}
    explicit IEEEDouble(double value) : bits(ReinterpretBits<bits_type>(value)) {}

    bits_type PhysicalSignificand() const {
        return bits & SignificandMask;
    }

    bits_type PhysicalExponent() const {
        return (bits & ExponentMask) >> PhysicalSignificandSize;
    }

    bool IsFinite() const {
        return (bits & ExponentMask) != ExponentMask;
    }

    bool IsInf() const {
        return (bits & ExponentMask) == ExponentMask && (bits & SignificandMask) == 0;
    }

    bool IsNaN() const {
        return (bits & ExponentMask) == ExponentMask && (bits & SignificandMask) != 0;
    }

    bool IsZero() const {
        return (bits & ~SignMask) == 0;
    }

    bool SignBit() const {
        return (bits & SignMask) != 0;
    }

    double Value() const {
        return ReinterpretBits<double>(bits);
    }

    double AbsValue() const {
        return ReinterpretBits<double>(bits & ~SignMask);
    }

    // Returns the next larger double. +Infinity is returned unchanged.
    double NextValue() const {
        SAFENUM_ASSERT(!SignBit());
        return ReinterpretBits<double>(IsInf() ? bits : bits + 1);
    }

    // Returns the next smaller double. +0 is returned unchanged.
    double PrevValue() const {
        SAFENUM_ASSERT(!SignBit());
        return ReinterpretBits<double>(IsZero() ? bits : bits - 1);
    }
};

struct DiyFp // f * 2^e
{
    static constexpr int SignificandSize = 64; // = q

    uint64_t f = 0;
    int e = 0;

    constexpr DiyFp() = default;
    constexpr DiyFp(uint64_t f_, int e_) : f(f_), e(e_) {}
};

// Returns the number of leading 0-bits in x, starting at the most significant bit position.
// If x is 0, the result is undefined.
inline int CountLeadingZeros64(uint64_t x)
{
    SAFENUM_ASSERT(x != 0);

#if defined(__GNUC__)
    return __builtin_clzll(x);
#else
    int lz = 0;
    while ((x >> 63) == 0) {
        x <<= 1;
        ++lz;
    }
    return lz;
#endif
}

// Decomposes `value` into `f * 2^e`.
// The result is not normalized.
// PRE: `value` must be finite and non-negative, i.e. >= +0.0.
inline DiyFp DiyFpFromDouble(double value)
{
    auto const v = IEEEDouble(value);

    SAFENUM_ASSERT(v.IsFinite());
    SAFENUM_ASSERT(!v.SignBit());

    auto const F = v.PhysicalSignificand();
    auto const E = v.PhysicalExponent();

    // If v is denormal:
    //      value = 0.F * 2^(1 - bias) = (          F) * 2^(1 - bias - (p-1))
    // If v is normalized:
    //      value = 1.F * 2^(E - bias) = (2^(p-1) + F) * 2^(E - bias - (p-1))

    return (E == 0) // denormal?
        ? DiyFp(F, IEEEDouble::MinExponent)
        : DiyFp(F + IEEEDouble::HiddenBit, static_cast<int>(E) - IEEEDouble::ExponentBias);
}

// Returns `f * 2^e`, +Infinity on overflow and 0 on underflow.
// PRE: f < 2^p, and f >= 2^(p-1) unless e is the minimum exponent.
inline double LoadDouble(uint64_t f, int e)
{
    SAFENUM_ASSERT(f <= IEEEDouble::HiddenBit + IEEEDouble::SignificandMask);
    SAFENUM_ASSERT(e <= IEEEDouble::MinExponent || (f & IEEEDouble::HiddenBit) != 0);

    if (e > IEEEDouble::MaxExponent)
    {
        return std::numeric_limits<double>::infinity();
    }
    if (e < IEEEDouble::MinExponent)
    {
        return 0.0;
    }

    uint64_t const exponent = (e == IEEEDouble::MinExponent && (f & IEEEDouble::HiddenBit) == 0)
        ? 0 // subnormal
        : static_cast<uint64_t>(e + IEEEDouble::ExponentBias);

    return ReinterpretBits<double>((exponent << IEEEDouble::PhysicalSignificandSize) | (f & IEEEDouble::SignificandMask));
}

// Compute the boundaries m- and m+ of the floating-point value
// v = f * 2^e.
//
// Determine v- and v+, the floating-point predecessor and successor if v,
// respectively.
//
//      v- = v - 2^e        if f != 2^(p-1) or e == e_min                (A)
//         = v - 2^(e-1)    if f == 2^(p-1) and e > e_min                (B)
//
//      v+ = v + 2^e
//
// Let m- = (v- + v) / 2 and m+ = (v + v+) / 2. All real numbers _strictly_
// between m- and m+ round to v, regardless of how the input rounding
// algorithm breaks ties.
//
//      ---+-------------+-------------+-------------+-------------+---  (A)
//         v-            m-            v             m+            v+
//
//      -----------------+------+------+-------------+-------------+---  (B)
//                       v-     m-     v             m+            v+

inline bool LowerBoundaryIsCloser(double value)
{
    IEEEDouble const v(value);

    SAFENUM_ASSERT(v.IsFinite());
    SAFENUM_ASSERT(!v.SignBit());

    return v.PhysicalSignificand() == 0 && v.PhysicalExponent() > 1;
}

// Returns the upper boundary m+ of value.
// The result is not normalized.
// PRE: `value` must be finite and non-negative.
inline DiyFp UpperBoundary(double value)
{
    auto const v = DiyFpFromDouble(value);
    return DiyFp(4*v.f + 2, v.e - 2);
}

// Returns the lower boundary m- of value.
// The result is not normalized.
// PRE: `value` must be finite and strictly positive.
inline DiyFp LowerBoundary(double value)
{
    SAFENUM_ASSERT(IEEEDouble(value).IsFinite());
    SAFENUM_ASSERT(value > 0);

    auto const v = DiyFpFromDouble(value);
    return DiyFp(4*v.f - 2 + (LowerBoundaryIsCloser(value) ? 1 : 0), v.e - 2);
}

// Returns whether the significand of v is even.
inline bool SignificandIsEven(double v)
{
    return (IEEEDouble(v).PhysicalSignificand() & 1) == 0;
}

} // namespace safenum
