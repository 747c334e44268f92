// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "format_digits.h"

#include "floatconv_config.h"

#include <cstring>

using namespace floatconv;

//==================================================================================================
// Digit printing
//==================================================================================================

static inline char* Utoa_2Digits(char* buf, uint32_t digits)
{
    static constexpr char Digits100[200] = {
        '0','0','0','1','0','2','0','3','0','4','0','5','0','6','0','7','0','8','0','9',
        '1','0','1','1','1','2','1','3','1','4','1','5','1','6','1','7','1','8','1','9',
        '2','0','2','1','2','2','2','3','2','4','2','5','2','6','2','7','2','8','2','9',
        '3','0','3','1','3','2','3','3','3','4','3','5','3','6','3','7','3','8','3','9',
        '4','0','4','1','4','2','4','3','4','4','4','5','4','6','4','7','4','8','4','9',
        '5','0','5','1','5','2','5','3','5','4','5','5','5','6','5','7','5','8','5','9',
        '6','0','6','1','6','2','6','3','6','4','6','5','6','6','6','7','6','8','6','9',
        '7','0','7','1','7','2','7','3','7','4','7','5','7','6','7','7','7','8','7','9',
        '8','0','8','1','8','2','8','3','8','4','8','5','8','6','8','7','8','8','8','9',
        '9','0','9','1','9','2','9','3','9','4','9','5','9','6','9','7','9','8','9','9',
    };

    FLOATCONV_ASSERT(digits <= 99);
    std::memcpy(buf, &Digits100[2 * digits], 2 * sizeof(char));
    return buf + 2;
}

// Writes the decimal digits of output so that they end at buf.
// Returns the start of the digits.
static inline char* PrintDecimalDigitsBackwards(char* buf, uint64_t output)
{
    // We prefer 32-bit operations, even on 64-bit platforms.
    // We have at most 17 digits, and uint32_t can store 9 digits.
    // If output doesn't fit into uint32_t, we cut off 8 digits,
    // so the rest will fit into uint32_t.
    if (static_cast<uint32_t>(output >> 32) != 0)
    {
        const uint64_t q = output / 100000000;
        uint32_t r = static_cast<uint32_t>(output % 100000000);
        output = q;
        for (int i = 0; i < 4; ++i)
        {
            buf -= 2;
            Utoa_2Digits(buf, r % 100);
            r /= 100;
        }
    }

    FLOATCONV_ASSERT(output <= UINT32_MAX);
    uint32_t output2 = static_cast<uint32_t>(output);

    while (output2 >= 100)
    {
        const uint32_t q = output2 / 100;
        const uint32_t r = output2 % 100;
        output2 = q;
        buf -= 2;
        Utoa_2Digits(buf, r);
    }

    if (output2 >= 10)
    {
        buf -= 2;
        Utoa_2Digits(buf, output2);
    }
    else
    {
        *--buf = static_cast<char>('0' + output2);
    }

    return buf;
}

static inline int32_t Max(int32_t x, int32_t y)
{
    return y < x ? x : y;
}

static inline int32_t ExponentLength(uint32_t k)
{
    if (k < 10) return 1;
    if (k < 100) return 2;
    if (k < 1000) return 3;
    return 4;
}

//==================================================================================================
// Layout
//==================================================================================================

namespace {

enum class Notation {
    fraction,   // 0.[000]digits[000]
    point,      // dig.its[000]
    integer,    // digits[000][.000]
    scientific, // d[.igits]e+123
};

struct Layout
{
    Notation notation;
    int32_t  zeros;          // fraction: zeros after "0."; integer: zeros after the digits
    int32_t  padding;        // zeros after the fractional part
    uint32_t abs_exponent;   // scientific
    int32_t  exponent_width; // scientific
    int32_t  length;         // total, including the sign
};

} // namespace

static Layout ComputeLayout(const DecimalDigits& dec, const FormatDialect& dialect)
{
    FLOATCONV_ASSERT(IsValid(dialect));
    FLOATCONV_ASSERT(dec.num_digits >= 1);
    FLOATCONV_ASSERT(dec.num_digits <= 17);

    const int32_t n = dec.num_digits;
    const int32_t x = dec.exponent;

    Layout layout = {};
    layout.length = dec.sign ? 1 : 0;

    if (dialect.min_fixed_exponent <= x && x <= dialect.max_fixed_exponent)
    {
        if (x < 0)
        {
            const int32_t fraction_digits = -x - 1 + n;
            layout.notation = Notation::fraction;
            layout.zeros = -x - 1;
            layout.padding = Max(0, dialect.min_fraction_digits - fraction_digits);
            layout.length += 2 + fraction_digits + layout.padding;
        }
        else if (x < n - 1)
        {
            const int32_t fraction_digits = n - 1 - x;
            layout.notation = Notation::point;
            layout.padding = Max(0, dialect.min_fraction_digits - fraction_digits);
            layout.length += n + 1 + layout.padding;
        }
        else
        {
            layout.notation = Notation::integer;
            layout.zeros = x - (n - 1);
            layout.padding = dialect.force_fraction ? Max(1, dialect.min_fraction_digits) : 0;
            layout.length += x + 1 + (layout.padding > 0 ? 1 + layout.padding : 0);
        }
    }
    else
    {
        layout.notation = Notation::scientific;
        layout.abs_exponent = static_cast<uint32_t>(x < 0 ? -x : x);
        layout.exponent_width = Max(dialect.min_exponent_digits, ExponentLength(layout.abs_exponent));
        layout.length += 1                              // leading digit
            + (n > 1 ? n : 0)                           // '.' and the remaining digits
            + 1                                         // exponent_char
            + ((x < 0 || dialect.exponent_plus_sign) ? 1 : 0)
            + layout.exponent_width;
    }

    return layout;
}

static inline char* FillZeros(char* buffer, int32_t count)
{
    FLOATCONV_ASSERT(count >= 0);
    std::memset(buffer, '0', static_cast<size_t>(count));
    return buffer + count;
}

//==================================================================================================
//
//==================================================================================================

int32_t floatconv::FormattedLength(const DecimalDigits& dec, const FormatDialect& dialect)
{
    return ComputeLayout(dec, dialect).length;
}

char* floatconv::FormatDigits(char* first, char* last, const DecimalDigits& dec, const FormatDialect& dialect)
{
    const Layout layout = ComputeLayout(dec, dialect);
    if (last - first < layout.length)
        return nullptr;

    const int32_t n = dec.num_digits;

    char digits[24];
    char* const digits_end = digits + n;
    PrintDecimalDigitsBackwards(digits_end, dec.significand);

    char* buffer = first;
    if (dec.sign)
        *buffer++ = '-';

    switch (layout.notation)
    {
    case Notation::fraction:
        std::memcpy(buffer, "0.", 2);
        buffer = FillZeros(buffer + 2, layout.zeros);
        std::memcpy(buffer, digits, static_cast<size_t>(n));
        buffer = FillZeros(buffer + n, layout.padding);
        break;

    case Notation::point:
        {
            const int32_t decimal_point = dec.exponent + 1;
            std::memcpy(buffer, digits, static_cast<size_t>(decimal_point));
            buffer += decimal_point;
            *buffer++ = '.';
            std::memcpy(buffer, digits + decimal_point, static_cast<size_t>(n - decimal_point));
            buffer = FillZeros(buffer + (n - decimal_point), layout.padding);
        }
        break;

    case Notation::integer:
        std::memcpy(buffer, digits, static_cast<size_t>(n));
        buffer = FillZeros(buffer + n, layout.zeros);
        if (layout.padding > 0)
        {
            *buffer++ = '.';
            buffer = FillZeros(buffer, layout.padding);
        }
        break;

    case Notation::scientific:
        {
            *buffer++ = digits[0];
            if (n > 1)
            {
                *buffer++ = '.';
                std::memcpy(buffer, digits + 1, static_cast<size_t>(n - 1));
                buffer += n - 1;
            }

            *buffer++ = dialect.exponent_char;
            if (dec.exponent < 0)
                *buffer++ = '-';
            else if (dialect.exponent_plus_sign)
                *buffer++ = '+';

            char* const exponent_end = buffer + layout.exponent_width;
            char* const p = PrintDecimalDigitsBackwards(exponent_end, layout.abs_exponent);
            FillZeros(buffer, static_cast<int32_t>(p - buffer));
            buffer = exponent_end;
        }
        break;
    }

    FLOATCONV_ASSERT(buffer - first == layout.length);
    return buffer;
}

int32_t floatconv::SpecialLength(FloatClass cls, bool sign, const FormatDialect& dialect)
{
    FLOATCONV_ASSERT(cls == FloatClass::infinity || cls == FloatClass::nan);

    if (cls == FloatClass::infinity)
        return (sign ? 1 : 0) + static_cast<int32_t>(std::strlen(dialect.infinity));

    return static_cast<int32_t>(std::strlen(dialect.nan));
}

char* floatconv::FormatSpecial(char* first, char* last, FloatClass cls, bool sign, const FormatDialect& dialect)
{
    const int32_t length = SpecialLength(cls, sign, dialect);
    if (last - first < length)
        return nullptr;

    const char* spelling = dialect.nan;
    if (cls == FloatClass::infinity)
    {
        if (sign)
            *first++ = '-';
        spelling = dialect.infinity;
    }

    const size_t len = std::strlen(spelling);
    std::memcpy(first, spelling, len);
    return first + len;
}
