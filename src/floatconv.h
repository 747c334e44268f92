// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "format_dialect.h"
#include "strtod.h"

#include <string>

namespace floatconv {

// Large enough for every finite and special value under the preset dialects.
constexpr int ToCharsMinBufferLength = 64;

// char* output_end = ToChars(first, last, value, dialect);
//
// Converts the given binary floating-point number into the shortest decimal text which reads
// back as the same number, laid out according to the dialect.
// Returns nullptr if [first, last) is too small. The output is _not_ null-terminated.
//
// PRE: IsValid(dialect)
char* ToChars(char* first, char* last, double value, const FormatDialect& dialect = FormatDialect::Default());
char* ToChars(char* first, char* last, float value, const FormatDialect& dialect = FormatDialect::Default());

std::string ToDecimalString(double value, const FormatDialect& dialect = FormatDialect::Default());
std::string ToDecimalString(float value, const FormatDialect& dialect = FormatDialect::Default());

// auto result = FromDecimalString<double>("1.5e10");
// if (result)
//     use(result.value);
//
// See Strtod for the accepted syntax. The overload taking a dialect also accepts its exponent
// character and its spellings of infinity and NaN.
template <typename Float>
ParseResult<Float> FromDecimalString(const std::string& text);

template <typename Float>
ParseResult<Float> FromDecimalString(const std::string& text, const FormatDialect& dialect);

template <> ParseResult<double> FromDecimalString<double>(const std::string& text);
template <> ParseResult<float>  FromDecimalString<float>(const std::string& text);
template <> ParseResult<double> FromDecimalString<double>(const std::string& text, const FormatDialect& dialect);
template <> ParseResult<float>  FromDecimalString<float>(const std::string& text, const FormatDialect& dialect);

} // namespace floatconv
