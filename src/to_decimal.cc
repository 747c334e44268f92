// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "to_decimal.h"

#include "floatconv_config.h"
#include "pow5_table.h"
#include "uint128.h"

using namespace floatconv;
using namespace floatconv::impl;

//==================================================================================================
//
//==================================================================================================

int32_t floatconv::DecimalLength(uint64_t v)
{
    FLOATCONV_ASSERT(v >= 1);
    FLOATCONV_ASSERT(v <= 99999999999999999ull);

    if (v >= 10000000000000000ull) { return 17; }
    if (v >= 1000000000000000ull) { return 16; }
    if (v >= 100000000000000ull) { return 15; }
    if (v >= 10000000000000ull) { return 14; }
    if (v >= 1000000000000ull) { return 13; }
    if (v >= 100000000000ull) { return 12; }
    if (v >= 10000000000ull) { return 11; }
    if (v >= 1000000000ull) { return 10; }
    if (v >= 100000000ull) { return 9; }
    if (v >= 10000000ull) { return 8; }
    if (v >= 1000000ull) { return 7; }
    if (v >= 100000ull) { return 6; }
    if (v >= 10000ull) { return 5; }
    if (v >= 1000ull) { return 4; }
    if (v >= 100ull) { return 3; }
    if (v >= 10ull) { return 2; }
    return 1;
}

bool floatconv::impl::MultipleOfPow5(uint64_t value, int32_t e5)
{
    static constexpr uint64_t kPow5[] = {
        1ull,
        5ull,
        25ull,
        125ull,
        625ull,
        3125ull,
        15625ull,
        78125ull,
        390625ull,
        1953125ull,
        9765625ull,
        48828125ull,
        244140625ull,
        1220703125ull,
        6103515625ull,
        30517578125ull,
        152587890625ull,
        762939453125ull,
        3814697265625ull,
        19073486328125ull,
        95367431640625ull,
        476837158203125ull,
        2384185791015625ull,
        11920928955078125ull,
        59604644775390625ull,
        298023223876953125ull,
        1490116119384765625ull,
        7450580596923828125ull, // 5^27
    };

    FLOATCONV_ASSERT(e5 >= 0);
    FLOATCONV_ASSERT(e5 <= 27);

    return value % kPow5[e5] == 0;
}

//==================================================================================================
// ToDecimal
//==================================================================================================

static inline void MulPow5DivPow2(uint64_t u, uint64_t v, uint64_t w, int32_t e5, int32_t e2, uint64_t& a, uint64_t& b, uint64_t& c)
{
    // j >= 120 and m has at most 53 + 2 = 55 bits.
    // The product along with the subsequent shift therefore requires
    // 55 + 128 - 120 = 63 bits.

    const int32_t k = FloorLog2Pow5(e5) + 1 - BitsPerPow5;
    const int32_t j = e2 - k;
    FLOATCONV_ASSERT(j >= BitsPerPow5 - 8);
    FLOATCONV_ASSERT(j <= BitsPerPow5 - 1);

    const uint64x2 pow5 = ComputePow5(e5);

    a = MulShift(u, pow5, j);
    b = MulShift(v, pow5, j);
    c = MulShift(w, pow5, j);
}

// Moves trailing zeros into the exponent.
static inline DecimalDigits MakeDecimal(uint64_t digits, int32_t e10)
{
    FLOATCONV_ASSERT(digits != 0);

    while (digits % 10 == 0)
    {
        digits /= 10;
        ++e10;
    }

    const int32_t num_digits = DecimalLength(digits);
    return {digits, num_digits, e10 + num_digits - 1, false};
}

template <typename Float>
static inline DecimalDigits ToDecimalImpl(uint64_t ieee_significand, uint64_t ieee_exponent)
{
    using Traits = IEEE<Float>;

    //
    // Step 1:
    // Decode the floating point number, and unify normalized and subnormal cases.
    //

    uint64_t m2;
    int32_t e2;
    if (ieee_exponent == 0)
    {
        m2 = ieee_significand;
        e2 = 1 - Traits::ExponentBias;
    }
    else
    {
        m2 = uint64_t{Traits::HiddenBit} | ieee_significand;
        e2 = static_cast<int32_t>(ieee_exponent) - Traits::ExponentBias;

        if /*unlikely*/ ((0 <= -e2 && -e2 < Traits::SignificandSize) && MultipleOfPow2(m2, -e2))
        {
            // Since 2^(p-1) <= m2 < 2^p and 0 <= -e2 <= p-1:
            //  1 <= value = m2 / 2^-e2 < 2^p.
            // Since m2 is divisible by 2^-e2, value is an integer.
            return MakeDecimal(m2 >> -e2, 0);
        }
    }

    const bool is_even = (m2 % 2) == 0;
    const bool accept_lower = is_even;
    const bool accept_upper = is_even;

    //
    // Step 2:
    // Determine the interval of valid decimal representations.
    //

    const uint32_t lower_boundary_is_closer = (ieee_significand == 0 && ieee_exponent > 1);

    e2 -= 2;
    const uint64_t u = 4 * m2 - 2 + lower_boundary_is_closer;
    const uint64_t v = 4 * m2;
    const uint64_t w = 4 * m2 + 2;

    //
    // Step 3:
    // Convert to a decimal power base.
    //

    int32_t e10;

    bool za = false; // a[0, ..., i-1] == 0
    bool zb = false; // b[0, ..., i-1] == 0
    bool zc = false; // c[0, ..., i-1] == 0

    if (e2 >= 0)
    {
        // (a,b,c) = (u,v,w) * 2^e2 / 10^q, where we remove one digit less than
        // log_10(2^e2) so that the loop below always determines the last removed digit.
        const int32_t q = FloorLog10Pow2(e2) - (e2 > 3); // == max(0, q' - 1)
        FLOATCONV_ASSERT(q >= 0);

        e10 = q;

        // The removed digits are all 0 iff x % 5^q == 0.
        if (q <= 22) // 22 = floor(log_5(2^53))
        {
            za = MultipleOfPow5(u, q);
            zb = MultipleOfPow5(v, q);
            zc = MultipleOfPow5(w, q);
        }
    }
    else
    {
        // (a,b,c) = (u,v,w) * 2^e2 / 10^(e2 + q)
        const int32_t q = FloorLog10Pow5(-e2) - (-e2 > 1); // == max(0, q' - 1)
        FLOATCONV_ASSERT(q >= 0);

        e10 = q + e2;
        FLOATCONV_ASSERT(e10 < 0);

        // The removed digits are all 0 iff x % 2^q == 0.
        if (q <= Traits::SignificandSize + 2)
        {
            za = MultipleOfPow2(u, q);
            zb = MultipleOfPow2(v, q);
            zc = MultipleOfPow2(w, q);
        }
    }

    uint64_t aq;
    uint64_t bq;
    uint64_t cq;
    MulPow5DivPow2(u, v, w, -e10, e10 - e2, aq, bq, cq);

    //
    // Step 4:
    // Find the shortest decimal representation in the interval of valid representations.
    //

    cq -= !accept_upper && zc;

    // mask = 10^(number of digits removed),
    // i.e., (bq % mask) contains the actual digits removed from bq.
    uint64_t mask = 1;

    uint64_t a = aq;
    uint64_t b = bq;
    uint64_t c = cq;

    while (a / 10 < c / 10)
    {
        mask *= 10;
        a /= 10;
        b /= 10;
        c /= 10;
        ++e10;
    }

    if /*likely*/ (!za && !zb)
    {
        const uint64_t br = bq - b * mask; // Digits removed from bq
        const uint64_t half = mask / 2;

        b += (a == b || br >= half);
    }
    else
    {
        // za currently determines whether the first q removed digits were all
        // 0's. Still need to check whether the digits removed in the loop above
        // are all 0's.
        const bool can_use_lower = accept_lower && za && (aq - a * mask == 0);
        if (can_use_lower)
        {
            FLOATCONV_ASSERT(a != 0);
            for (;;)
            {
                const uint64_t q = a / 10;
                const uint32_t r = Lo32(a) - 10 * Lo32(q); // = a % 10
                if (r != 0)
                    break;
                mask *= 10;
                a = q;
                b = q;
                ++e10;
            }
        }

        const uint64_t br = bq - b * mask; // Digits removed from bq
        const uint64_t half = mask / 2;

        // A return value of b is valid if and only if a != b or za == true.
        // A return value of b + 1 is valid if and only if b + 1 <= c.
        const bool round_up = (a == b && !can_use_lower) // out of range
            || (br > half)
            || (br == half && (!zb || b % 2 != 0));

        b += round_up;
    }

    return MakeDecimal(b, e10);
}

template <typename Float>
static inline DecimalDigits ToDecimalFinite(const BinaryFloat<Float>& x)
{
    FLOATCONV_ASSERT(x.IsFinite());

    DecimalDigits dec;
    if (x.cls == FloatClass::zero)
        dec = {0, 1, 0, false};
    else
        dec = ToDecimalImpl<Float>(x.mantissa, x.biased_exponent);

    dec.sign = x.sign;
    return dec;
}

DecimalDigits floatconv::ToDecimal(const BinaryFloat<float>& x)
{
    return ToDecimalFinite(x);
}

DecimalDigits floatconv::ToDecimal(const BinaryFloat<double>& x)
{
    return ToDecimalFinite(x);
}
