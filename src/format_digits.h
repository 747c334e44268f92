// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "format_dialect.h"
#include "ieee.h"
#include "to_decimal.h"

#include <cstdint>

namespace floatconv {

// Returns the number of characters FormatDigits writes for the given number.
// PRE: IsValid(dialect)
int32_t FormattedLength(const DecimalDigits& dec, const FormatDialect& dialect);

// Writes the decimal number into [first, last) using fixed or scientific notation, as selected by
// the dialect. The digits are written exactly as given.
// Returns the end of the output, or nullptr if the buffer is too small. The output is not
// null-terminated.
// PRE: IsValid(dialect)
char* FormatDigits(char* first, char* last, const DecimalDigits& dec, const FormatDialect& dialect);

// Returns the number of characters FormatSpecial writes.
// PRE: cls is FloatClass::infinity or FloatClass::nan
int32_t SpecialLength(FloatClass cls, bool sign, const FormatDialect& dialect);

// Writes the dialect's spelling of infinity or NaN into [first, last).
// The sign is used for infinity only.
// Returns the end of the output, or nullptr if the buffer is too small.
char* FormatSpecial(char* first, char* last, FloatClass cls, bool sign, const FormatDialect& dialect);

} // namespace floatconv
