// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "format_dialect.h"

#include <cstdint>

namespace floatconv {

enum class ParseStatus {
    ok,
    empty_input,        // The input has no characters.
    invalid_character,  // A character outside the grammar.
    missing_digits,     // A sign or decimal point, but no digits.
    malformed_exponent, // An exponent marker without exponent digits.
};

// Returns a short description, e.g. "missing digits".
const char* ToString(ParseStatus status);

template <typename Float>
struct ParseResult
{
    Float value;
    ParseStatus status;
    // End of the input on success, the offending character otherwise.
    const char* next;

    // Test for success.
    explicit operator bool() const noexcept
    {
        return status == ParseStatus::ok;
    }
};

// ParseResult<double> result = Strtod(first, last);
//
// Converts the decimal number in [first, last) into the nearest binary floating-point number
// (round-to-nearest-even). The whole input must match
//
//      [+-] ( digits [ '.' digits* ] | '.' digits ) [ (e|E) [+-] digits ]
//      [+-] ( inf | infinity | nan )       (case-insensitive)
//
// Leading or trailing whitespace is not allowed.
// Inputs too large for the format give +-infinity; inputs too small give +-0. Neither is an error.
//
// The overloads taking a dialect also accept the dialect's exponent character and its spellings
// of infinity and NaN, so that everything the formatter writes can be read back.
ParseResult<double> Strtod(const char* first, const char* last);
ParseResult<double> Strtod(const char* first, const char* last, const FormatDialect& dialect);
ParseResult<float>  Strtof(const char* first, const char* last);
ParseResult<float>  Strtof(const char* first, const char* last, const FormatDialect& dialect);

// Maximum number of significant digits the parser keeps.
//
// The longest double in decimal representation is (2^53 - 1) * 5^1074 / 10^1074, which has 767
// digits. If the first digits of an input are equal to a mean of 2 adjacent doubles (that could
// have up to 768 digits) the result must be rounded to the bigger one unless the tail consists of
// zeros, so we don't need to preserve all the digits. Likewise for float with 112 + 1 digits.
constexpr int MaxSignificantDigitsDouble = 767 + 1;
constexpr int MaxSignificantDigitsSingle = 112 + 1;

// Returns the binary value nearest to
//
//      digits * 10^exponent                        if !nonzero_tail,
//      (digits + epsilon) * 10^exponent            otherwise,
//
// where digits is the integer spelled by [digits, digits + num_digits) and 0 < epsilon < 1.
// The digits may have leading and trailing zeros. The result is non-negative.
//
// PRE: [digits, digits + num_digits) consists of '0'...'9' only
// PRE: nonzero_tail implies that at least one of the digits is non-zero
double DecimalToDouble(const char* digits, int num_digits, int64_t exponent, bool nonzero_tail = false);
float  DecimalToSingle(const char* digits, int num_digits, int64_t exponent, bool nonzero_tail = false);

} // namespace floatconv
