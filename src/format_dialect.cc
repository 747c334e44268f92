// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "format_dialect.h"

#include <cstring>

using namespace floatconv;

// The exponent thresholds are limited so that fixed notation never needs more than a few hundred
// zeros, and the spellings must be non-empty and must not start with a digit, a sign or '.',
// so that they can be told apart from numbers when parsing.
static constexpr int MaxFractionDigits = 64;
static constexpr int MinFixedExponentLimit = -400;
static constexpr int MaxFixedExponentLimit =  400;
static constexpr int MaxExponentDigits = 4;
static constexpr size_t MaxSpellingLength = 32;

static constexpr FormatDialect kDefaultDialect = {
    /*min_fraction_digits*/ 0,
    /*force_fraction*/      false,
    /*min_fixed_exponent*/  -7,
    /*max_fixed_exponent*/  16,
    /*exponent_char*/       'e',
    /*exponent_plus_sign*/  true,
    /*min_exponent_digits*/ 1,
    /*infinity*/            "inf",
    /*nan*/                 "nan",
};

static constexpr FormatDialect kCompatibilityDialect = {
    /*min_fraction_digits*/ 1,
    /*force_fraction*/      true,
    /*min_fixed_exponent*/  -4,
    /*max_fixed_exponent*/  13,
    /*exponent_char*/       'e',
    /*exponent_plus_sign*/  true,
    /*min_exponent_digits*/ 2,
    /*infinity*/            "inf",
    /*nan*/                 "nan",
};

const FormatDialect& FormatDialect::Default()
{
    return kDefaultDialect;
}

const FormatDialect& FormatDialect::Compatibility()
{
    return kCompatibilityDialect;
}

static bool IsValidSpelling(const char* s)
{
    if (s == nullptr)
        return false;

    const size_t len = std::strlen(s);
    if (len == 0 || len > MaxSpellingLength)
        return false;

    const char ch = s[0];
    return !('0' <= ch && ch <= '9') && ch != '+' && ch != '-' && ch != '.';
}

static inline char ToLowerASCII(char ch)
{
    return ('A' <= ch && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
}

static bool EqualsIgnoreCase(const char* s, const char* lower_case)
{
    for ( ; *s != '\0' && *lower_case != '\0'; ++s, ++lower_case)
    {
        if (ToLowerASCII(*s) != *lower_case)
            return false;
    }

    return *s == '\0' && *lower_case == '\0';
}

// The parser always accepts "inf", "infinity" and "nan" in any case, and tries infinity first.
static bool IsInfinitySpelling(const char* s)
{
    return EqualsIgnoreCase(s, "inf") || EqualsIgnoreCase(s, "infinity");
}

bool floatconv::IsValid(const FormatDialect& dialect)
{
    if (dialect.min_fraction_digits < 0 || dialect.min_fraction_digits > MaxFractionDigits)
        return false;
    if (dialect.min_fixed_exponent < MinFixedExponentLimit || dialect.max_fixed_exponent > MaxFixedExponentLimit)
        return false;
    if (dialect.min_fixed_exponent > dialect.max_fixed_exponent + 1)
        return false;
    if (dialect.min_exponent_digits < 1 || dialect.min_exponent_digits > MaxExponentDigits)
        return false;

    const char ch = dialect.exponent_char;
    if (ch == '\0' || ('0' <= ch && ch <= '9') || ch == '+' || ch == '-' || ch == '.')
        return false;

    if (!IsValidSpelling(dialect.infinity) || !IsValidSpelling(dialect.nan))
        return false;

    // Each spelling must read back as the value it was written for.
    if (std::strcmp(dialect.infinity, dialect.nan) == 0)
        return false;
    if (IsInfinitySpelling(dialect.nan) || EqualsIgnoreCase(dialect.infinity, "nan"))
        return false;

    return true;
}
