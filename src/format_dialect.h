// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

namespace floatconv {

// Text layout rules for numeric output.
//
// Let x be the decimal exponent of the leading digit (the exponent in d.ddd * 10^x).
// The formatter uses fixed notation iff min_fixed_exponent <= x <= max_fixed_exponent, and
// scientific notation otherwise.
struct FormatDialect
{
    // Fixed notation: pad the fractional part with zeros up to this many digits.
    int min_fraction_digits;
    // Fixed notation: integral values get a fractional part of max(1, min_fraction_digits) zeros.
    bool force_fraction;

    int min_fixed_exponent;
    int max_fixed_exponent;

    char exponent_char;
    // Write positive exponents as "e+5".
    bool exponent_plus_sign;
    // Exponents are zero-padded to at least this many digits, e.g. 2 gives "e-05".
    int min_exponent_digits;

    // Spellings for the special values. The sign is prepended to infinity only.
    const char* infinity;
    const char* nan;

    // Shortest text, '.' and the exponent only where needed:
    //  1e-8, 0.0000001, 100, 1234567890123456, 1.2345678901234568e+17, -0, inf, nan
    static const FormatDialect& Default();

    // The rules of Lua's (and LuaJIT's) tostring for numbers: "%.14g" layout, plus a trailing
    // ".0" on integral values.
    //  100.0, -0.0, 0.0001, 1e-05, 1e+14, inf, -inf, nan
    static const FormatDialect& Compatibility();
};

// Returns whether the options are within the supported ranges, and whether the spellings of
// infinity and NaN parse back as the values they stand for.
bool IsValid(const FormatDialect& dialect);

} // namespace floatconv
