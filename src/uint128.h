// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "floatconv_config.h"

#include <cstdint>
#if _MSC_VER
#include <intrin.h>
#endif

// Exact 128-bit arithmetic used by the encoder and the parser.

namespace floatconv {
namespace impl {

struct uint64x2 {
    uint64_t hi;
    uint64_t lo;
};

inline bool operator==(const uint64x2& x, const uint64x2& y) { return x.hi == y.hi && x.lo == y.lo; }
inline bool operator!=(const uint64x2& x, const uint64x2& y) { return !(x == y); }

inline uint32_t Lo32(uint64_t x)
{
    return static_cast<uint32_t>(x & 0xFFFFFFFFu);
}

inline uint32_t Hi32(uint64_t x)
{
    return static_cast<uint32_t>(x >> 32);
}

inline int32_t FloorLog2(uint64_t x)
{
    FLOATCONV_ASSERT(x != 0);

#if defined(__GNUC__) || defined(__clang__)
    return 63 - __builtin_clzll(x);
#elif defined(_MSC_VER) && defined(_M_X64)
    unsigned long index;
    _BitScanReverse64(&index, x);
    return static_cast<int32_t>(index);
#else
    int32_t l2 = 0;
    for (;;)
    {
        x >>= 1;
        if (x == 0)
            break;
        ++l2;
    }
    return l2;
#endif
}

// Returns the full product a * b.
inline uint64x2 Mul128(uint64_t a, uint64_t b)
{
#if defined(__SIZEOF_INT128__)
    __extension__ using uint128_t = unsigned __int128;

    const uint128_t p = uint128_t{a} * b;
    return {static_cast<uint64_t>(p >> 64), static_cast<uint64_t>(p)};
#elif defined(_MSC_VER) && defined(_M_X64)
    uint64_t hi;
    uint64_t lo = _umul128(a, b, &hi);
    return {hi, lo};
#else
    const uint64_t b00 = uint64_t{Lo32(a)} * Lo32(b);
    const uint64_t b01 = uint64_t{Lo32(a)} * Hi32(b);
    const uint64_t b10 = uint64_t{Hi32(a)} * Lo32(b);
    const uint64_t b11 = uint64_t{Hi32(a)} * Hi32(b);

    const uint64_t mid1 = b10 + Hi32(b00);
    const uint64_t mid2 = b01 + Lo32(mid1);

    const uint64_t hi = b11 + Hi32(mid1) + Hi32(mid2);
    const uint64_t lo = Lo32(b00) | uint64_t{Lo32(mid2)} << 32;
    return {hi, lo};
#endif
}

// Returns the low 64 bits of (hi:lo) >> n.
inline uint64_t ShiftRight128(uint64_t lo, uint64_t hi, int32_t n)
{
    FLOATCONV_ASSERT(n >= 1);
    FLOATCONV_ASSERT(n <= 127);

    if (n >= 64)
        return hi >> (n - 64);

    return (hi << (64 - n)) | (lo >> n);
}

// Returns floor(m * mul / 2^j), where mul = mul.hi * 2^64 + mul.lo.
// The result must fit into 64 bits.
inline uint64_t MulShift(uint64_t m, const uint64x2& mul, int32_t j)
{
    FLOATCONV_ASSERT(j >= 64 + 1);
    FLOATCONV_ASSERT(j <= 64 + 127);

    const uint64x2 b0 = Mul128(m, mul.lo);
    uint64x2 b2 = Mul128(m, mul.hi);

    // b2 + (b0 >> 64)
    b2.lo += b0.hi;
    b2.hi += b2.lo < b0.hi;

    return ShiftRight128(b2.lo, b2.hi, j - 64);
}

} // namespace impl
} // namespace floatconv
