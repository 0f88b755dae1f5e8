// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "ieee.h"

#include <cstdint>
#include <cstring>

namespace safenum {
namespace impl {

inline constexpr int Min(int x, int y) { return y < x ? y : x; }
inline constexpr int Max(int x, int y) { return y < x ? x : y; }

//==================================================================================================
// DiyInt
//
// Unsigned fixed-capacity big integer, stored as little-endian base-2^32 bigits.
//
// The capacity covers the largest intermediate of both conversion directions:
//  - DecimalToDouble compares  digits * 5^k (<= 769 decimal digits, k <= 324 - 1 + 769)
//    against f * 2^e and needs 64 + log_2(5^1092) + a few shift bits.
//  - Dragon4 keeps r, s, m- and m+ below 2^1130.
//==================================================================================================

struct DiyInt
{
    static constexpr int MaxBits   = 64 + 2536 + 128;
    static constexpr int BigitSize = 32;
    static constexpr int Capacity  = (MaxBits + (BigitSize - 1)) / BigitSize;

    uint32_t bigits[Capacity]; // Significand stored in little-endian form.
    int      size = 0;

    DiyInt() = default;
    DiyInt(DiyInt const&) = delete;             // (not needed here)
    DiyInt& operator=(DiyInt const&) = delete;  // (not needed here)
};

// x := value
inline void AssignU32(DiyInt& x, uint32_t value)
{
    x.bigits[0] = value;
    x.size = (value != 0) ? 1 : 0;
}

// x := value
inline void AssignU64(DiyInt& x, uint64_t value)
{
    x.bigits[0] = static_cast<uint32_t>(value);
    x.bigits[1] = static_cast<uint32_t>(value >> 32);
    x.size = (x.bigits[1] != 0) ? 2 : ((x.bigits[0] != 0) ? 1 : 0);
}

// x := A * x + B
inline void MulAddU32(DiyInt& x, uint32_t A, uint32_t B = 0)
{
    SAFENUM_ASSERT(x.size >= 0);

    if (A == 1 && B == 0)
    {
        return;
    }
    if (A == 0 || x.size == 0)
    {
        AssignU32(x, B);
        return;
    }

    uint32_t carry = B;
    for (int i = 0; i < x.size; ++i)
    {
        uint64_t const p = uint64_t{x.bigits[i]} * A + carry;
        x.bigits[i]      = static_cast<uint32_t>(p);
        carry            = static_cast<uint32_t>(p >> 32);
    }

    if (carry != 0)
    {
        SAFENUM_ASSERT(x.size < DiyInt::Capacity);
        x.bigits[x.size++] = carry;
    }
}

// Returns the value of the decimal digits [first, last).
// PRE: last - first <= 9
inline uint32_t ReadDecimalU32(char const* first, char const* last)
{
    SAFENUM_ASSERT(last - first <= 9);

    uint32_t value = 0;
    for ( ; first != last; ++first)
    {
        SAFENUM_ASSERT('0' <= *first && *first <= '9');
        value = 10 * value + static_cast<uint32_t>(*first - '0');
    }

    return value;
}

// x := digits (interpreted as a decimal integer)
inline void AssignDecimalDigits(DiyInt& x, char const* digits, int num_digits)
{
    static constexpr uint32_t kPow10[] = {
        1, // (unused)
        10,
        100,
        1000,
        10000,
        100000,
        1000000,
        10000000,
        100000000,
        1000000000, // 10^9
    };

    AssignU32(x, 0);

    while (num_digits > 0)
    {
        int const n = Min(num_digits, 9);
        MulAddU32(x, kPow10[n], ReadDecimalU32(digits, digits + n));
        digits     += n;
        num_digits -= n;
    }
}

// x := x * 2^e2
inline void MulPow2(DiyInt& x, int e2) // aka left-shift
{
    SAFENUM_ASSERT(x.size >= 0);
    SAFENUM_ASSERT(e2 >= 0);

    if (x.size == 0 || e2 == 0)
        return;

    int const bigit_shift = e2 / 32;
    int const bit_shift   = e2 % 32;

    if (bit_shift > 0)
    {
        uint32_t carry = 0;
        for (int i = 0; i < x.size; ++i)
        {
            uint32_t const h = x.bigits[i] >> (32 - bit_shift);
            x.bigits[i]      = x.bigits[i] << bit_shift | carry;
            carry            = h;
        }

        if (carry != 0)
        {
            SAFENUM_ASSERT(x.size < DiyInt::Capacity);
            x.bigits[x.size++] = carry;
        }
    }

    if (bigit_shift > 0)
    {
        SAFENUM_ASSERT(x.size <= DiyInt::Capacity - bigit_shift);

        std::memmove(x.bigits + bigit_shift, x.bigits, sizeof(uint32_t) * static_cast<size_t>(x.size));
        std::memset(x.bigits, 0, sizeof(uint32_t) * static_cast<size_t>(bigit_shift));
        x.size += bigit_shift;
    }
}

// x := x * 5^e5
inline void MulPow5(DiyInt& x, int e5)
{
    static constexpr uint32_t kPow5[] = {
        1, // (unused)
        5,
        25,
        125,
        625,
        3125,
        15625,
        78125,
        390625,
        1953125,
        9765625,
        48828125,
        244140625,
        1220703125, // 5^13
    };

    SAFENUM_ASSERT(e5 >= 0);

    if (x.size == 0)
        return;

    while (e5 > 0)
    {
        int const n = Min(e5, 13);
        MulAddU32(x, kPow5[n]);
        e5 -= n;
    }
}

// x := 2 * x
inline void Mul2(DiyInt& x)
{
    MulPow2(x, 1);
}

// x := 10 * x
inline void Mul10(DiyInt& x)
{
    MulAddU32(x, 10);
}

// x := 2^e2
inline void AssignPow2(DiyInt& x, int e2)
{
    SAFENUM_ASSERT(e2 >= 0);

    int const bigit_shift = e2 / 32;
    int const bit_shift   = e2 % 32;

    SAFENUM_ASSERT(bigit_shift < DiyInt::Capacity);

    std::memset(x.bigits, 0, sizeof(uint32_t) * static_cast<size_t>(bigit_shift));
    x.bigits[bigit_shift] = uint32_t{1} << bit_shift;
    x.size = bigit_shift + 1;
}

// x := 10^e10
inline void AssignPow10(DiyInt& x, int e10)
{
    AssignU32(x, 1);
    MulPow5(x, e10);
    MulPow2(x, e10);
}

// x := value * 2^e2
inline void AssignU64MulPow2(DiyInt& x, uint64_t value, int e2)
{
    AssignU64(x, value);
    MulPow2(x, e2);
}

// x := value * 10^e10
inline void AssignU64MulPow10(DiyInt& x, uint64_t value, int e10)
{
    AssignU64MulPow2(x, value, e10);
    MulPow5(x, e10);
}

// x := 2^e2 * 5^e5
inline void AssignPow2MulPow5(DiyInt& x, int e2, int e5)
{
    AssignPow2(x, e2);
    MulPow5(x, e5);
}

// Returns the number of leading 0-bits in x, starting at the most significant bit position.
// If x is 0, the result is undefined.
inline int CountLeadingZeros32(uint32_t x)
{
    SAFENUM_ASSERT(x != 0);

#if defined(__GNUC__)
    return __builtin_clz(x);
#else
    int z = 0;
    while ((x >> 31) == 0) {
        x <<= 1;
        ++z;
    }
    return z;
#endif
}

// Returns Compare(lhs, rhs): -1, 0 or +1.
inline int Compare(DiyInt const& lhs, DiyInt const& rhs)
{
    int const n1 = lhs.size;
    int const n2 = rhs.size;

    if (n1 < n2) return -1;
    if (n1 > n2) return +1;

    for (int i = n1 - 1; i >= 0; --i)
    {
        uint32_t const b1 = lhs.bigits[i];
        uint32_t const b2 = rhs.bigits[i];

        if (b1 < b2) return -1;
        if (b1 > b2) return +1;
    }

    return 0;
}

// Returns Compare(a + b, c)
inline int CompareAdd(DiyInt const& a, DiyInt const& b, DiyInt const& c)
{
    int const na = a.size;
    int const nb = b.size;
    int const nc = c.size;

    int const m = Max(na, nb);
    if (m + 1 < nc)
        return -1; // a + b cannot be larger or equal to c
    if (m > nc)
        return +1; // max(a, b) > c

    // Left-to-right subtraction, propagating a borrow digit (base 2^32) to the right,
    // stopping as soon as a + b > c or a + b < c is decided.

    uint64_t borrow = 0;
    for (int i = nc - 1; i >= 0; --i)
    {
        // Invariant:
        // The leading digits of s = a + b and the leading digits of c (after
        // possibly subtracting a borrow) are equal.

        SAFENUM_ASSERT(borrow == 0 || borrow == 1);
        uint64_t const ci = borrow << 32 | c.bigits[i];
        uint32_t const ai = i < na ? a.bigits[i] : 0;
        uint32_t const bi = i < nb ? b.bigits[i] : 0;
        uint64_t const si = uint64_t{ai} + bi;
        uint64_t const di = ci - si;
        if (di > ci)
        {
            // ci < si and all leading digits are equal: a + b > c.
            return +1;
        }
        if (di > 1)
        {
            // The trailing digits cannot compensate the difference: a + b < c.
            return -1;
        }

        borrow = di;
    }

    return -static_cast<int>(borrow);
}

// q, r = divmod(u, v)
// u := r
// return q
// PRE: 0 <= q <= 9
//
// Knuth, TAOCP Vol. 2, 4.3.1, Algorithm D, specialized to a single quotient digit.
inline uint32_t DivMod(DiyInt& u, DiyInt const& v)
{
    SAFENUM_ASSERT(u.size > 0);
    SAFENUM_ASSERT(v.size > 0);
    SAFENUM_ASSERT(u.bigits[u.size - 1] != 0);
    SAFENUM_ASSERT(v.bigits[v.size - 1] != 0);

    int const m = u.size;
    int const n = v.size;
    if (m < n)
    {
        return 0;
    }

    // D0. Single-bigit divisor. (Algorithm D requires n >= 2.)
    if (n == 1)
    {
        uint32_t const den = v.bigits[0];

        uint32_t q = 0;
        uint32_t r = 0;
        for (int i = m - 1; i >= 0; --i)
        {
            uint64_t const t = (uint64_t{r} << 32) | u.bigits[i];
            q = static_cast<uint32_t>(t / den);
            r = static_cast<uint32_t>(t % den);
        }
        AssignU32(u, r);
        return q;
    }

    SAFENUM_ASSERT(DiyInt::Capacity >= m + 1);
    u.bigits[m] = 0;

    // D1. Normalize.
    // Only the leading bigits of the normalized u and v are needed to estimate q',
    // so they are computed on the fly instead of shifting u and v.

    uint32_t v1 = v.bigits[n - 1];
    uint32_t v2 = v.bigits[n - 2];

    int const shift = CountLeadingZeros32(v1);
    if (shift > 0)
    {
        uint32_t const v3 = (n >= 3) ? v.bigits[n - 3] : 0;
        v1 = (v1 << shift) | (v2 >> (32 - shift));
        v2 = (v2 << shift) | (v3 >> (32 - shift));
    }

    uint32_t u0 = u.bigits[n];
    uint32_t u1 = u.bigits[n - 1];
    uint32_t u2 = u.bigits[n - 2];

    if (shift > 0)
    {
        SAFENUM_ASSERT((u0 >> (32 - shift)) == 0);

        uint32_t const u3 = (n >= 3) ? u.bigits[n - 3] : 0;
        u0 = (u0 << shift) | (u1 >> (32 - shift));
        u1 = (u1 << shift) | (u2 >> (32 - shift));
        u2 = (u2 << shift) | (u3 >> (32 - shift));
    }

    // D3. Calculate q'.
    // Repeated subtraction instead of a 64-bit division; q' is small.
    uint64_t rp = uint64_t{u0} << 32 | u1;
    uint32_t qp = 0;
    while (rp >= v1)
    {
        rp -= v1;
        qp++;
    }
    // q' <= q + 2
    SAFENUM_ASSERT(qp <= 11);

    // Now q' <= q + 1.
    while (qp > 0 && rp <= UINT32_MAX && uint64_t{qp} * v2 > (rp << 32 | u2))
    {
        qp--;
        rp += v1;
    }
    SAFENUM_ASSERT(qp <= 10);

    if (qp == 0)
    {
        return 0;
    }

    // D4. Multiply and subtract.
    uint32_t borrow = 0;
    for (int i = 0; i < n; ++i)
    {
        uint32_t const ui = u.bigits[i];
        uint32_t const vi = v.bigits[i];
        uint64_t const p  = uint64_t{qp} * vi + borrow;
        uint32_t const si = static_cast<uint32_t>(p);
        borrow            = static_cast<uint32_t>(p >> 32);
        uint32_t const di = ui - si;
        borrow           += di > ui;
        u.bigits[i]       = di;
    }
    uint32_t const un = u.bigits[n];
    uint32_t const dn = un - borrow;
    u.bigits[n] = dn;

    // D5. Test remainder.
    if (dn > un)
    {
        // D6. Add back.
        qp--;

        uint32_t carry = 0;
        for (int i = 0; i < n; ++i)
        {
            uint64_t const s = uint64_t{u.bigits[i]} + v.bigits[i] + carry;
            u.bigits[i]      = static_cast<uint32_t>(s);
            carry            = static_cast<uint32_t>(s >> 32);
        }
        u.bigits[n] += carry;
    }
    SAFENUM_ASSERT(qp <= 9);

    // Clamp the remainder.
    int k = n + 1;
    for ( ; k > 0 && u.bigits[k - 1] == 0; --k)
    {
    }
    u.size = k;

    return qp;
}

} // namespace impl
} // namespace safenum
