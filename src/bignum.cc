// Copyright 2017 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "bignum.h"

#include "floatconv_config.h"

using namespace floatconv::impl;

static inline int Min(int x, int y) { return y < x ? y : x; }

static inline void Clamp(Bignum& x)
{
    while (x.size > 0 && x.bigits[x.size - 1] == 0)
        --x.size;
}

static inline uint32_t ReadU32(char const* f, char const* l)
{
    FLOATCONV_ASSERT(l - f <= 9);

    uint32_t value = 0;
    for ( ; f != l; ++f)
    {
        FLOATCONV_ASSERT('0' <= *f && *f <= '9');
        value = 10 * value + static_cast<uint32_t>(*f - '0');
    }

    return value;
}

void floatconv::impl::AssignZero(Bignum& x)
{
    x.size = 0;
}

void floatconv::impl::AssignU64(Bignum& x, uint64_t value)
{
    x.bigits[0] = static_cast<uint32_t>(value);
    x.bigits[1] = static_cast<uint32_t>(value >> Bignum::BigitSize);
    x.size = 2;
    Clamp(x);
}

void floatconv::impl::AssignPow2(Bignum& x, int exp)
{
    FLOATCONV_ASSERT(exp >= 0);
    FLOATCONV_ASSERT(exp < Bignum::Capacity * Bignum::BigitSize);

    int const bigit_index = exp / Bignum::BigitSize;
    for (int i = 0; i < bigit_index; ++i)
        x.bigits[i] = 0;

    x.bigits[bigit_index] = uint32_t{1} << (exp % Bignum::BigitSize);
    x.size = bigit_index + 1;
}

void floatconv::impl::MulAddU32(Bignum& x, uint32_t A, uint32_t B)
{
    if (A == 0 || x.size == 0)
    {
        AssignU64(x, B);
        return;
    }

    uint32_t carry = B;
    for (int i = 0; i < x.size; ++i)
    {
        uint64_t const p = uint64_t{x.bigits[i]} * A + carry;
        x.bigits[i]      = static_cast<uint32_t>(p);
        carry            = static_cast<uint32_t>(p >> Bignum::BigitSize);
    }

    if (carry != 0)
    {
        FLOATCONV_ASSERT(x.size < Bignum::Capacity);
        x.bigits[x.size++] = carry;
    }
}

void floatconv::impl::AssignDecimalDigits(Bignum& x, char const* digits, int num_digits)
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

    AssignZero(x);

    while (num_digits > 0)
    {
        int const n = Min(num_digits, 9);
        MulAddU32(x, kPow10[n], ReadU32(digits, digits + n));
        digits     += n;
        num_digits -= n;
    }
}

void floatconv::impl::MulPow2(Bignum& x, int exp) // aka left-shift
{
    FLOATCONV_ASSERT(exp >= 0);

    if (x.size == 0 || exp == 0)
        return;

    int const bigit_shift = exp / Bignum::BigitSize;
    int const bit_shift   = exp % Bignum::BigitSize;

    FLOATCONV_ASSERT(x.size + bigit_shift + (bit_shift > 0) <= Bignum::Capacity);

    if (bit_shift > 0)
    {
        uint32_t carry = 0;
        for (int i = 0; i < x.size; ++i)
        {
            uint32_t const h = x.bigits[i] >> (Bignum::BigitSize - bit_shift);
            x.bigits[i]      = x.bigits[i] << bit_shift | carry;
            carry            = h;
        }

        if (carry != 0)
        {
            x.bigits[x.size++] = carry;
        }
    }

    if (bigit_shift > 0)
    {
        for (int i = x.size - 1; i >= 0; --i)
            x.bigits[i + bigit_shift] = x.bigits[i];
        for (int i = 0; i < bigit_shift; ++i)
            x.bigits[i] = 0;

        x.size += bigit_shift;
    }
}

void floatconv::impl::MulPow5(Bignum& x, int exp)
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

    FLOATCONV_ASSERT(exp >= 0);

    if (x.size == 0)
        return;

    while (exp > 0)
    {
        int const n = Min(exp, 13);
        MulAddU32(x, kPow5[n]);
        exp -= n;
    }
}

void floatconv::impl::ShiftRight(Bignum& x, int exp)
{
    FLOATCONV_ASSERT(exp >= 0);

    int const bigit_shift = exp / Bignum::BigitSize;
    int const bit_shift   = exp % Bignum::BigitSize;

    if (bigit_shift >= x.size)
    {
        x.size = 0;
        return;
    }

    if (bigit_shift > 0)
    {
        for (int i = bigit_shift; i < x.size; ++i)
            x.bigits[i - bigit_shift] = x.bigits[i];

        x.size -= bigit_shift;
    }

    if (bit_shift > 0)
    {
        for (int i = 0; i < x.size - 1; ++i)
        {
            x.bigits[i] = (x.bigits[i] >> bit_shift) | (x.bigits[i + 1] << (Bignum::BigitSize - bit_shift));
        }
        x.bigits[x.size - 1] >>= bit_shift;
    }

    Clamp(x);
}

void floatconv::impl::SubtractInPlace(Bignum& x, Bignum const& y)
{
    FLOATCONV_ASSERT(Compare(x, y) >= 0);

    uint32_t borrow = 0;
    for (int i = 0; i < x.size; ++i)
    {
        uint64_t const rhs = uint64_t{i < y.size ? y.bigits[i] : 0u} + borrow;
        uint64_t const lhs = x.bigits[i];
        x.bigits[i] = static_cast<uint32_t>(lhs - rhs);
        borrow      = lhs < rhs ? 1u : 0u;
    }

    FLOATCONV_ASSERT(borrow == 0);
    Clamp(x);
}

int floatconv::impl::Compare(Bignum const& lhs, Bignum const& rhs)
{
    if (lhs.size < rhs.size) return -1;
    if (lhs.size > rhs.size) return +1;

    for (int i = lhs.size - 1; i >= 0; --i)
    {
        uint32_t const b1 = lhs.bigits[i];
        uint32_t const b2 = rhs.bigits[i];

        if (b1 < b2) return -1;
        if (b1 > b2) return +1;
    }

    return 0;
}

uint64_t floatconv::impl::Word64(Bignum const& x, int index)
{
    FLOATCONV_ASSERT(index >= 0);

    int const i = 2 * index;
    uint64_t const lo = i     < x.size ? x.bigits[i]     : 0u;
    uint64_t const hi = i + 1 < x.size ? x.bigits[i + 1] : 0u;
    return hi << 32 | lo;
}
