// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "floatconv_config.h"
#include "uint128.h"

#include <cstdint>

namespace floatconv {
namespace impl {

constexpr int32_t BitsPerPow5 = 128;

// Range of the power-of-five table.
// Shared by float and double: the encoder needs [-324, 44] resp. [-45, 31] and the parser needs
// [-340, 325] for double (float inputs are parsed through the double path).
constexpr int32_t MinPow5Exponent = -340;
constexpr int32_t MaxPow5Exponent =  325;

// Returns floor(x / 2^n).
inline int32_t FloorDivPow2(int32_t x, int32_t n)
{
    return x >> n;
}

inline int32_t FloorLog2Pow5(int32_t e)
{
    FLOATCONV_ASSERT(e >= -1764);
    FLOATCONV_ASSERT(e <=  1763);
    return FloorDivPow2(e * 1217359, 19);
}

inline int32_t FloorLog10Pow2(int32_t e)
{
    FLOATCONV_ASSERT(e >= -2620);
    FLOATCONV_ASSERT(e <=  2620);
    return FloorDivPow2(e * 315653, 20);
}

inline int32_t FloorLog10Pow5(int32_t e)
{
    FLOATCONV_ASSERT(e >= -2620);
    FLOATCONV_ASSERT(e <=  2620);
    return FloorDivPow2(e * 732923, 20);
}

inline int32_t FloorLog2Pow10(int32_t e)
{
    FLOATCONV_ASSERT(e >= -1233);
    FLOATCONV_ASSERT(e <=  1233);
    return FloorDivPow2(e * 1741647, 19);
}

// Returns the BitsPerPow5 leading bits of 5^k, i.e.
//
//  floor(5^k / 2^e)    for k >= 0,
//  ceil(5^k / 2^e)     for k < 0,
//
// where e = FloorLog2Pow5(k) + 1 - BitsPerPow5.
//
// The table is computed on first use. It is immutable afterwards and may be read concurrently.
uint64x2 ComputePow5(int32_t k);

} // namespace impl
} // namespace floatconv
