// Copyright 2017 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cstdint>

namespace floatconv {
namespace impl {

// Exact unsigned integer with a fixed capacity.
//
// The capacity is large enough for every intermediate value the parser and the power-of-five
// table generator need: the largest is f * 5^(324 + 769) * 2^k with f < 2^55, which has less than
// 64 + 2536 + 64 bits.
struct Bignum
{
    static constexpr int MaxBits   = 64 + 2536 + 64 + 32;
    static constexpr int BigitSize = 32;
    static constexpr int Capacity  = (MaxBits + (BigitSize - 1)) / BigitSize;

    uint32_t bigits[Capacity]; // Stored in little-endian form.
    int      size = 0;         // bigits[size - 1] != 0, unless size == 0

    Bignum() = default;
    Bignum(Bignum const&) = delete;
    Bignum& operator=(Bignum const&) = delete;
};

void AssignZero(Bignum& x);
void AssignU64(Bignum& x, uint64_t value);

// x := 2^exp
void AssignPow2(Bignum& x, int exp);

// x := the integer spelled by the given decimal digits.
void AssignDecimalDigits(Bignum& x, char const* digits, int num_digits);

// x := A * x + B
void MulAddU32(Bignum& x, uint32_t A, uint32_t B = 0);

// x := x * 2^exp
void MulPow2(Bignum& x, int exp);

// x := x * 5^exp
void MulPow5(Bignum& x, int exp);

// x := floor(x / 2^exp)
void ShiftRight(Bignum& x, int exp);

// x := x - y
// PRE: x >= y
void SubtractInPlace(Bignum& x, Bignum const& y);

// Returns -1, 0 or +1.
int Compare(Bignum const& lhs, Bignum const& rhs);

inline bool IsZero(Bignum const& x) { return x.size == 0; }

// Returns the bits [64 * index, 64 * index + 64) of x.
uint64_t Word64(Bignum const& x, int index);

} // namespace impl
} // namespace floatconv
