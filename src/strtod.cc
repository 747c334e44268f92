// Copyright 2020 Ulf Adams
// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "strtod.h"

#include "bignum.h"
#include "floatconv_config.h"
#include "ieee.h"
#include "pow5_table.h"
#include "to_decimal.h"
#include "uint128.h"

#include <cstring>
#include <limits>

using namespace floatconv;
using namespace floatconv::impl;

const char* floatconv::ToString(ParseStatus status)
{
    switch (status)
    {
    case ParseStatus::ok:
        return "ok";
    case ParseStatus::empty_input:
        return "empty input";
    case ParseStatus::invalid_character:
        return "invalid character";
    case ParseStatus::missing_digits:
        return "missing digits";
    case ParseStatus::malformed_exponent:
        return "malformed exponent";
    }

    return "unknown";
}

//==================================================================================================
// Limits
//==================================================================================================

namespace {

template <typename Float> struct DecimalLimits;

template <>
struct DecimalLimits<double>
{
    static constexpr int MaxSignificantDigits = MaxSignificantDigitsDouble;
    // Any input <= 10^MinDecimalExponent is interpreted as 0.
    // Any input >  10^MaxDecimalExponent is interpreted as +Infinity.
    static constexpr int MinDecimalExponent = -324; // denorm_min / 2 = 2.4703282292062327e-324 >= 10^-324
    static constexpr int MaxDecimalExponent =  309; //            max = 1.7976931348623158e+308 <= 10^+309
};

template <>
struct DecimalLimits<float>
{
    static constexpr int MaxSignificantDigits = MaxSignificantDigitsSingle;
    static constexpr int MinDecimalExponent = -46; // denorm_min / 2 = 7.0064923e-46 >= 10^-46
    static constexpr int MaxDecimalExponent =  39; //            max = 3.4028235e+38 <= 10^+39
};

} // namespace

//==================================================================================================
// ToBinary64
//==================================================================================================

// Maximum number of decimal digits in the significand ToBinary64 can handle.
static constexpr int32_t ToBinaryMaxDecimalDigits = 17;

static inline int32_t Max(int32_t x, int32_t y)
{
    return y < x ? x : y;
}

static inline int32_t ExtractBit(uint64_t x, int32_t n)
{
    FLOATCONV_ASSERT(n >= 0);
    FLOATCONV_ASSERT(n <= 63);
    return (x & (uint64_t{1} << n)) != 0;
}

// Returns m10 * 10^e10 correctly rounded.
static inline double ToBinary64(uint64_t m10, int32_t m10_digits, int32_t e10)
{
    using Double = IEEE<double>;

    static constexpr int32_t MantissaBits = Double::PhysicalSignificandSize;
    static constexpr int32_t ExponentBias = Double::ExponentBias - Double::PhysicalSignificandSize;

    FLOATCONV_ASSERT(m10 > 0);
    FLOATCONV_ASSERT(m10_digits == DecimalLength(m10));
    FLOATCONV_ASSERT(m10_digits <= ToBinaryMaxDecimalDigits);
    FLOATCONV_ASSERT(e10 >  DecimalLimits<double>::MinDecimalExponent - m10_digits);
    FLOATCONV_ASSERT(e10 <= DecimalLimits<double>::MaxDecimalExponent - m10_digits);
    static_cast<void>(m10_digits);

    // Convert to binary float m2 * 2^e2, while retaining information about whether the conversion
    // was exact.

    const int32_t log2_m10 = FloorLog2(m10);
    FLOATCONV_ASSERT(log2_m10 >= 0);
    FLOATCONV_ASSERT(log2_m10 <= 56); // 56 = floor(log_2(10^17))

    // We want to compute the (MantissaBits + 1) top-most bits (+1 for the implicit leading
    // one in IEEE format). We therefore choose a binary output exponent of
    //   e2 = log2(m10 * 10^e10) - (MantissaBits + 1).
    //
    // We compute [m10 * 10^e10 / 2^e2] == [m10 * 5^e10 / 2^(e2 - e10)]
    //
    //  j = (e2 - e10) - (floor(log_2(5^e10)) + 1 - BitsPerPow5)
    //    = log2_m10 + BitsPerPow5 - MantissaBits - 2
    //
    // Since 0 <= log2_m10 <= 56, we have 74 <= j <= 130.

    const int32_t log2_10_e10 = FloorLog2Pow10(e10);
    const int32_t e2 = log2_m10 + log2_10_e10 - (MantissaBits + 1);

    const uint64x2 pow5 = ComputePow5(e10);
    const int32_t j = log2_m10 + (BitsPerPow5 - MantissaBits - 2);
    FLOATCONV_ASSERT(j >= 74);
    FLOATCONV_ASSERT(j <= 130);
    const uint64_t m2 = MulShift(m10, pow5, j);

    const int32_t log2_m2 = FloorLog2(m2);
    FLOATCONV_ASSERT(log2_m2 >= 53);
    FLOATCONV_ASSERT(log2_m2 <= 54);

    // We also compute if the result is exact, i.e., [m10 * 10^e10 / 2^e2] == m10 * 10^e10 / 2^e2.
    //  (See: Ryu Revisited, Section 4.3)
    //
    //  e10 >= 0: exact iff e2 <= e10 or p2(m10) >= e2 - e10
    //  e10 <  0: additionally p5(m10) >= -e10

    bool is_exact = (e2 <= e10) || (e2 - e10 < 64 && MultipleOfPow2(m10, e2 - e10));
    if (e10 < 0)
    {
        // 24 = floor(log_5(2^57))
        is_exact = is_exact && (-e10 <= 24 && MultipleOfPow5(m10, -e10));
    }

    // Compute the final IEEE exponent.
    int32_t ieee_e2 = Max(0, log2_m2 + e2 + ExponentBias);
    if (ieee_e2 >= static_cast<int32_t>(Double::MaxIeeeExponent))
    {
        // Overflow:
        // Final IEEE exponent is larger than the maximum representable.
        return std::numeric_limits<double>::infinity();
    }

    // We need to figure out how much we need to shift m2.
    // The tricky part is that we need to take the final IEEE exponent into account, so we need to
    // reverse the bias and also special-case the value 0.
    const int32_t shift = (ieee_e2 == 0 ? 1 : ieee_e2) - e2 - (ExponentBias + MantissaBits);
    FLOATCONV_ASSERT(shift > 0);
    FLOATCONV_ASSERT(shift < 64);

    // We need to round up if the exact value is more than 0.5 above the value we computed. That's
    // equivalent to checking if the last removed bit was 1 and either the value was not just
    // trailing zeros or the result would otherwise be odd.
    const bool trailing_zeros
        = is_exact && MultipleOfPow2(m2, shift - 1);
    const int32_t last_removed_bit
        = ExtractBit(m2, shift - 1);
    const bool round_up
        = last_removed_bit != 0 && (!trailing_zeros || ExtractBit(m2, shift) != 0);

    uint64_t significand = (m2 >> shift) + round_up;
    FLOATCONV_ASSERT(significand <= 2 * Double::HiddenBit); // significand <= 2^p = 2^53

    significand &= Double::SignificandMask;

    // Rounding up may cause overflow...
    if (significand == 0 && round_up)
    {
        // Rounding up did overflow the p-bit significand.
        // Move a trailing zero of the significand into the exponent.
        // Due to how the IEEE represents +/-Infinity, we don't need to check for overflow here.
        ++ieee_e2;
    }

    FLOATCONV_ASSERT(ieee_e2 <= static_cast<int32_t>(Double::MaxIeeeExponent));
    const uint64_t ieee = static_cast<uint64_t>(ieee_e2) << MantissaBits | significand;
    return ReinterpretBits<double>(ieee);
}

//==================================================================================================
// DecimalToBinary
//
// Start with the Ryu result for the leading 17 digits, then correct it by comparing the exact
// input against the halfway points between the guess and its neighbours.
//
// [1] Clinger, "How to read floating point numbers accurately",
//     PLDI '90 Proceedings of the ACM SIGPLAN 1990 conference on Programming language design and
//     implementation, Pages 92-101
//==================================================================================================

static inline uint64_t ReadU64(const char* f, const char* l)
{
    FLOATCONV_ASSERT(l - f <= 19);

    uint64_t value = 0;
    for ( ; f != l; ++f)
    {
        FLOATCONV_ASSERT('0' <= *f && *f <= '9');
        value = 10 * value + static_cast<uint32_t>(*f - '0');
    }

    return value;
}

// Compare digits * 10^exponent with f * 2^e.
// If nonzero_tail is set, digits is replaced by (10 * digits + 1) and exponent by (exponent - 1),
// which is equivalent for the comparison with any number with at most num_digits significant digits.
//
// PRE: num_digits + exponent <= MaxDecimalExponent
// PRE: num_digits + exponent >  MinDecimalExponent
static int CompareBufferWithDiyFp(const char* digits, int num_digits, int exponent, bool nonzero_tail, uint64_t f, int e)
{
    FLOATCONV_ASSERT(num_digits > 0);

    Bignum lhs;
    Bignum rhs;

    AssignDecimalDigits(lhs, digits, num_digits);
    if (nonzero_tail)
    {
        MulAddU32(lhs, 10, 1);
        exponent--;
    }
    AssignU64(rhs, f);

    int lhs_exp5 = 0;
    int rhs_exp5 = 0;
    int lhs_exp2 = 0;
    int rhs_exp2 = 0;

    if (exponent >= 0)
    {
        lhs_exp5 += exponent;
        lhs_exp2 += exponent;
    }
    else
    {
        rhs_exp5 -= exponent;
        rhs_exp2 -= exponent;
    }

    if (e >= 0)
    {
        rhs_exp2 += e;
    }
    else
    {
        lhs_exp2 -= e;
    }

    if (lhs_exp5 > 0)
    {
        MulPow5(lhs, lhs_exp5);
    }
    else if (rhs_exp5 > 0)
    {
        MulPow5(rhs, rhs_exp5);
    }

    // Cancel common factors of 2.
    const int diff_exp2 = lhs_exp2 - rhs_exp2;
    if (diff_exp2 > 0)
    {
        MulPow2(lhs, diff_exp2);
    }
    else if (diff_exp2 < 0)
    {
        MulPow2(rhs, -diff_exp2);
    }

    return Compare(lhs, rhs);
}

// Compares the input with the midpoint between the (positive, finite) float with the given
// bit pattern and its successor.
template <typename Float>
static int CompareWithUpperBoundary(const char* digits, int num_digits, int exponent, bool nonzero_tail, typename IEEE<Float>::bits_type bits)
{
    using Traits = IEEE<Float>;

    const Traits v(bits);
    FLOATCONV_ASSERT(v.IsFinite());
    FLOATCONV_ASSERT(!v.SignBit());

    uint64_t f = v.PhysicalSignificand();
    int e;
    if (v.PhysicalExponent() == 0)
    {
        e = Traits::MinExponent;
    }
    else
    {
        f |= Traits::HiddenBit;
        e = static_cast<int>(v.PhysicalExponent()) - Traits::ExponentBias;
    }

    // m+ = (f + 1/2) * 2^e = (2f + 1) * 2^(e - 1)
    return CompareBufferWithDiyFp(digits, num_digits, exponent, nonzero_tail, 2 * f + 1, e - 1);
}

template <typename Float>
static inline Float InitialGuess(double guess)
{
    return static_cast<Float>(guess);
}

template <>
inline float InitialGuess<float>(double guess)
{
    // Out of range conversions are undefined behavior.
    if (guess > static_cast<double>(std::numeric_limits<float>::max()))
        return std::numeric_limits<float>::infinity();

    return static_cast<float>(guess);
}

template <typename Float>
static Float DecimalToBinary(const char* digits, int num_digits, int64_t exponent, bool nonzero_tail)
{
    using Traits = IEEE<Float>;
    using Limits = DecimalLimits<Float>;
    using bits_type = typename Traits::bits_type;

    FLOATCONV_ASSERT(num_digits >= 0);

    // Remove leading zeros.
    while (num_digits > 0 && digits[0] == '0')
    {
        ++digits;
        --num_digits;
    }

    // Move trailing zeros into the exponent.
    // If the tail is non-zero, the trailing zeros are significant and must stay.
    if (!nonzero_tail)
    {
        while (num_digits > 0 && digits[num_digits - 1] == '0')
        {
            --num_digits;
            ++exponent;
        }
    }

    if (num_digits == 0)
    {
        // (0 + epsilon) * 10^exponent has no meaningful interpretation here.
        FLOATCONV_ASSERT(!nonzero_tail);
        return 0;
    }

    if (num_digits > Limits::MaxSignificantDigits)
    {
        for (int i = Limits::MaxSignificantDigits; i < num_digits; ++i)
        {
            if (digits[i] != '0')
            {
                nonzero_tail = true;
                break;
            }
        }

        exponent += num_digits - Limits::MaxSignificantDigits;
        num_digits = Limits::MaxSignificantDigits;
    }

    // Any v <= 10^MinDecimalExponent is interpreted as 0.
    if (num_digits + exponent <= Limits::MinDecimalExponent)
        return 0;

    // Any v > 10^MaxDecimalExponent is interpreted as +Infinity.
    if (num_digits + exponent > Limits::MaxDecimalExponent)
        return std::numeric_limits<Float>::infinity();

    const int exponent32 = static_cast<int>(exponent);

    // Ryu for the leading digits.
    const int read_digits = num_digits < ToBinaryMaxDecimalDigits ? num_digits : ToBinaryMaxDecimalDigits;
    const uint64_t m10 = ReadU64(digits, digits + read_digits);
    const double guess = ToBinary64(m10, read_digits, exponent32 + (num_digits - read_digits));

    if (Traits::SignificandSize == IEEE<double>::SignificandSize && read_digits == num_digits && !nonzero_tail)
    {
        // The input is exactly m10 * 10^e10, and ToBinary64 is correctly rounded.
        return static_cast<Float>(guess);
    }

    bits_type bits = Traits(InitialGuess<Float>(guess)).bits;

    for (;;)
    {
        if (bits > 0)
        {
            const bits_type prev = bits - 1;
            const int cmp = CompareWithUpperBoundary<Float>(digits, num_digits, exponent32, nonzero_tail, prev);
            if (cmp < 0 || (cmp == 0 && (prev & 1) == 0))
            {
                bits = prev;
                continue;
            }
        }

        if (bits < Traits::InfinityBits)
        {
            const int cmp = CompareWithUpperBoundary<Float>(digits, num_digits, exponent32, nonzero_tail, bits);
            if (cmp > 0 || (cmp == 0 && (bits & 1) != 0))
            {
                ++bits;
                continue;
            }
        }

        break;
    }

    return Traits(bits).Value();
}

double floatconv::DecimalToDouble(const char* digits, int num_digits, int64_t exponent, bool nonzero_tail)
{
    return DecimalToBinary<double>(digits, num_digits, exponent, nonzero_tail);
}

float floatconv::DecimalToSingle(const char* digits, int num_digits, int64_t exponent, bool nonzero_tail)
{
    return DecimalToBinary<float>(digits, num_digits, exponent, nonzero_tail);
}

//==================================================================================================
// Strtod
//==================================================================================================

static inline bool IsDigit(char ch)
{
    return static_cast<unsigned>(ch - '0') <= 9u;
}

static inline char ToLowerASCII(char ch)
{
    return ('A' <= ch && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
}

// Returns whether [next, last) equals the given lower-case string, ignoring case.
static inline bool EqualsIgnoreCase(const char* next, const char* last, const char* lower_case)
{
    for ( ; next != last && *lower_case != '\0'; ++next, ++lower_case)
    {
        if (ToLowerASCII(*next) != *lower_case)
            return false;
    }

    return next == last && *lower_case == '\0';
}

static inline bool Equals(const char* next, const char* last, const char* str)
{
    const size_t len = std::strlen(str);
    return static_cast<size_t>(last - next) == len && std::memcmp(next, str, len) == 0;
}

namespace {

struct DecimalInput
{
    char    digits[MaxSignificantDigitsDouble];
    int     num_digits = 0;
    int64_t exponent = 0;
    bool    nonzero_tail = false;
};

} // namespace

// Leading zeros are dropped; digits beyond the buffer only set nonzero_tail.
static inline void AppendDigit(DecimalInput& in, char ch, bool in_fraction)
{
    if (in.num_digits == 0 && ch == '0')
    {
        in.exponent -= in_fraction;
        return;
    }

    if (in.num_digits < MaxSignificantDigitsDouble)
    {
        in.digits[in.num_digits++] = ch;
        in.exponent -= in_fraction;
    }
    else
    {
        in.nonzero_tail |= (ch != '0');
        in.exponent += !in_fraction;
    }
}

template <typename Float>
static FLOATCONV_NEVER_INLINE bool ParseSpecial(bool is_negative, const char* next, const char* last, const FormatDialect* dialect, Float& value)
{
    const bool is_inf = EqualsIgnoreCase(next, last, "inf")
        || EqualsIgnoreCase(next, last, "infinity")
        || (dialect != nullptr && Equals(next, last, dialect->infinity));
    if (is_inf)
    {
        value = is_negative ? -std::numeric_limits<Float>::infinity() : std::numeric_limits<Float>::infinity();
        return true;
    }

    const bool is_nan = EqualsIgnoreCase(next, last, "nan")
        || (dialect != nullptr && Equals(next, last, dialect->nan));
    if (is_nan)
    {
        value = std::numeric_limits<Float>::quiet_NaN();
        return true;
    }

    return false;
}

template <typename Float>
static ParseResult<Float> Parse(const char* next, const char* last, const FormatDialect* dialect)
{
    // Exponents larger than this limit will be treated as +Infinity.
    // But we must still scan all the digits if this happens to be the case.
    static constexpr int64_t MaxExp = 99999999;

    if (next == last)
        return {0, ParseStatus::empty_input, next};

    const auto is_exponent_char = [&](char ch) {
        return ch == 'e' || ch == 'E' || (dialect != nullptr && ch == dialect->exponent_char);
    };

// [+-]

    const bool is_negative = (*next == '-');
    if (is_negative || *next == '+')
        ++next;

// int

    DecimalInput in;

    bool has_digits = false;
    while (next != last && IsDigit(*next))
    {
        has_digits = true;
        AppendDigit(in, *next, /*in_fraction*/ false);
        ++next;
    }

// frac

    bool has_point = false;
    if (next != last && *next == '.')
    {
        has_point = true;
        ++next;
        while (next != last && IsDigit(*next))
        {
            has_digits = true;
            AppendDigit(in, *next, /*in_fraction*/ true);
            ++next;
        }
    }

    if (!has_digits)
    {
        if (!has_point)
        {
            Float value = 0;
            if (next != last && ParseSpecial(is_negative, next, last, dialect, value))
                return {value, ParseStatus::ok, last};
        }

        if (next == last || has_point || is_exponent_char(*next))
            return {0, ParseStatus::missing_digits, next};

        return {0, ParseStatus::invalid_character, next};
    }

// exp

    if (next != last && is_exponent_char(*next))
    {
        ++next;

        bool exponent_is_negative = false;
        if (next != last && (*next == '-' || *next == '+'))
        {
            exponent_is_negative = (*next == '-');
            ++next;
        }

        if (next == last || !IsDigit(*next))
            return {0, ParseStatus::malformed_exponent, next};

        int64_t parsed_exponent = 0;
        while (next != last && IsDigit(*next))
        {
            if (parsed_exponent <= MaxExp)
                parsed_exponent = 10 * parsed_exponent + (*next - '0');
            ++next;
        }

        in.exponent += exponent_is_negative ? -parsed_exponent : parsed_exponent;
    }

    if (next != last)
        return {0, ParseStatus::invalid_character, next};

    const Float value = DecimalToBinary<Float>(in.digits, in.num_digits, in.exponent, in.nonzero_tail);
    return {is_negative ? -value : value, ParseStatus::ok, next};
}

ParseResult<double> floatconv::Strtod(const char* first, const char* last)
{
    return Parse<double>(first, last, nullptr);
}

ParseResult<double> floatconv::Strtod(const char* first, const char* last, const FormatDialect& dialect)
{
    return Parse<double>(first, last, &dialect);
}

ParseResult<float> floatconv::Strtof(const char* first, const char* last)
{
    return Parse<float>(first, last, nullptr);
}

ParseResult<float> floatconv::Strtof(const char* first, const char* last, const FormatDialect& dialect)
{
    return Parse<float>(first, last, &dialect);
}
