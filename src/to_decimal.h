// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "ieee.h"

#include <cstdint>

namespace floatconv {

// value = (sign ? -1 : +1) * significand * 10^(exponent - num_digits + 1)
//
// The significand has exactly num_digits decimal digits and no trailing zeros.
// Zero is represented as {0, 1, 0, sign}.
struct DecimalDigits
{
    uint64_t significand;
    int32_t  num_digits;
    int32_t  exponent; // of the leading digit, as in d.ddd * 10^exponent
    bool     sign;
};

// Returns the shortest decimal representation which rounds back to the given value (using
// round-to-nearest-even), as in Ryu. If there are several shortest representations, the one
// closest to the value is returned; exact ties between two candidates pick the even one.
//
// PRE: x.IsFinite()
DecimalDigits ToDecimal(const BinaryFloat<float>& x);
DecimalDigits ToDecimal(const BinaryFloat<double>& x);

inline DecimalDigits ToDecimal(float value) { return ToDecimal(Decompose(value)); }
inline DecimalDigits ToDecimal(double value) { return ToDecimal(Decompose(value)); }

// Returns the number of decimal digits in v.
// PRE: 1 <= v < 10^17
int32_t DecimalLength(uint64_t v);

namespace impl {

// Returns whether value is divisible by 5^e5.
// PRE: 0 <= e5 <= 27
bool MultipleOfPow5(uint64_t value, int32_t e5);

// Returns whether value is divisible by 2^e2.
inline bool MultipleOfPow2(uint64_t value, int32_t e2)
{
    return (value & ((uint64_t{1} << e2) - 1)) == 0;
}

} // namespace impl

} // namespace floatconv
