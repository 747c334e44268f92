// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "pow5_table.h"

#include "bignum.h"

using namespace floatconv::impl;

namespace {

struct Pow5Table
{
    static constexpr int32_t Size = MaxPow5Exponent - MinPow5Exponent + 1;

    uint64x2 entries[Size];

    Pow5Table();
};

} // namespace

// Computes floor(5^k / 2^e), k >= 0.
static void ComputePositive(uint64x2& entry, int32_t k, int32_t e, Bignum& x)
{
    AssignU64(x, 1);
    MulPow5(x, k);

    if (e >= 0)
        ShiftRight(x, e);
    else
        MulPow2(x, -e);

    FLOATCONV_ASSERT(Word64(x, 2) == 0);
    entry.hi = Word64(x, 1);
    entry.lo = Word64(x, 0);
}

// Computes ceil(2^-e / 5^-k), k < 0.
// Restoring long division: the quotient has exactly BitsPerPow5 bits.
static void ComputeNegative(uint64x2& entry, int32_t k, int32_t e, Bignum& r, Bignum& t)
{
    AssignPow2(r, -e);

    AssignU64(t, 1);
    MulPow5(t, -k);
    MulPow2(t, BitsPerPow5 - 1);

    uint64_t hi = 0;
    uint64_t lo = 0;
    for (int32_t i = BitsPerPow5 - 1; i >= 0; --i)
    {
        if (Compare(t, r) <= 0)
        {
            SubtractInPlace(r, t);
            if (i >= 64)
                hi |= uint64_t{1} << (i - 64);
            else
                lo |= uint64_t{1} << i;
        }
        ShiftRight(t, 1);
    }

    FLOATCONV_ASSERT((hi >> 63) != 0);

    if (!IsZero(r))
    {
        ++lo;
        hi += (lo == 0);
    }

    entry.hi = hi;
    entry.lo = lo;
}

Pow5Table::Pow5Table()
{
    Bignum x;
    Bignum y;

    for (int32_t k = MinPow5Exponent; k <= MaxPow5Exponent; ++k)
    {
        const int32_t e = FloorLog2Pow5(k) + 1 - BitsPerPow5;
        uint64x2& entry = entries[k - MinPow5Exponent];

        if (k >= 0)
            ComputePositive(entry, k, e, x);
        else
            ComputeNegative(entry, k, e, x, y);
    }
}

uint64x2 floatconv::impl::ComputePow5(int32_t k)
{
    FLOATCONV_ASSERT(k >= MinPow5Exponent);
    FLOATCONV_ASSERT(k <= MaxPow5Exponent);

    static const Pow5Table table;
    return table.entries[k - MinPow5Exponent];
}
