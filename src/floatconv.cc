// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "floatconv.h"

#include "floatconv_config.h"
#include "format_digits.h"
#include "ieee.h"
#include "to_decimal.h"

using namespace floatconv;

template <typename Float>
static inline char* ToCharsImpl(char* first, char* last, Float value, const FormatDialect& dialect)
{
    const BinaryFloat<Float> x = Decompose(value);
    if (!x.IsFinite())
        return FormatSpecial(first, last, x.cls, x.sign, dialect);

    return FormatDigits(first, last, ToDecimal(x), dialect);
}

template <typename Float>
static inline std::string ToStringImpl(Float value, const FormatDialect& dialect)
{
    const BinaryFloat<Float> x = Decompose(value);

    std::string str;
    char* end;
    if (!x.IsFinite())
    {
        str.resize(static_cast<size_t>(SpecialLength(x.cls, x.sign, dialect)));
        end = FormatSpecial(&str[0], &str[0] + str.size(), x.cls, x.sign, dialect);
    }
    else
    {
        const DecimalDigits dec = ToDecimal(x);
        str.resize(static_cast<size_t>(FormattedLength(dec, dialect)));
        end = FormatDigits(&str[0], &str[0] + str.size(), dec, dialect);
    }

    FLOATCONV_ASSERT(end == &str[0] + str.size());
    static_cast<void>(end);

    return str;
}

char* floatconv::ToChars(char* first, char* last, double value, const FormatDialect& dialect)
{
    return ToCharsImpl(first, last, value, dialect);
}

char* floatconv::ToChars(char* first, char* last, float value, const FormatDialect& dialect)
{
    return ToCharsImpl(first, last, value, dialect);
}

std::string floatconv::ToDecimalString(double value, const FormatDialect& dialect)
{
    return ToStringImpl(value, dialect);
}

std::string floatconv::ToDecimalString(float value, const FormatDialect& dialect)
{
    return ToStringImpl(value, dialect);
}

namespace floatconv {

template <>
ParseResult<double> FromDecimalString<double>(const std::string& text)
{
    return Strtod(text.data(), text.data() + text.size());
}

template <>
ParseResult<float> FromDecimalString<float>(const std::string& text)
{
    return Strtof(text.data(), text.data() + text.size());
}

template <>
ParseResult<double> FromDecimalString<double>(const std::string& text, const FormatDialect& dialect)
{
    return Strtod(text.data(), text.data() + text.size(), dialect);
}

template <>
ParseResult<float> FromDecimalString<float>(const std::string& text, const FormatDialect& dialect)
{
    return Strtof(text.data(), text.data() + text.size(), dialect);
}

} // namespace floatconv
