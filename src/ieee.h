// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cstdint>
#include <cstring>
#include <limits>

namespace floatconv {

namespace impl {

// All reinterpretation of floating-point bit patterns goes through this function.
template <typename Dest, typename Source>
inline Dest ReinterpretBits(Source source)
{
    static_assert(sizeof(Dest) == sizeof(Source), "size mismatch");

    Dest dest;
    std::memcpy(&dest, &source, sizeof(Source));
    return dest;
}

template <int Precision> struct BitsType;
template <> struct BitsType<24> { using type = uint32_t; };
template <> struct BitsType<53> { using type = uint64_t; };

} // namespace impl

template <typename Float>
struct IEEE
{
    static_assert(std::numeric_limits<Float>::is_iec559 &&
                  ((std::numeric_limits<Float>::digits == 24 && std::numeric_limits<Float>::max_exponent == 128) ||
                   (std::numeric_limits<Float>::digits == 53 && std::numeric_limits<Float>::max_exponent == 1024)),
        "IEEE-754 single- or double-precision implementation required");

    using value_type = Float;
    using bits_type = typename floatconv::impl::BitsType<std::numeric_limits<Float>::digits>::type;

    static constexpr int       SignificandSize         = std::numeric_limits<value_type>::digits; // = p   (includes the hidden bit)
    static constexpr int       PhysicalSignificandSize = SignificandSize - 1;                     // = p-1 (excludes the hidden bit)
    static constexpr int       UnbiasedMinExponent     = 1;
    static constexpr int       UnbiasedMaxExponent     = 2 * std::numeric_limits<value_type>::max_exponent - 1 - 1;
    static constexpr int       ExponentBias            = std::numeric_limits<value_type>::max_exponent - 1 + (SignificandSize - 1);
    static constexpr int       MinExponent             = UnbiasedMinExponent - ExponentBias;
    static constexpr int       MaxExponent             = UnbiasedMaxExponent - ExponentBias;
    static constexpr bits_type MaxIeeeExponent         = bits_type{2 * std::numeric_limits<value_type>::max_exponent - 1};
    static constexpr bits_type HiddenBit               = bits_type{1} << (SignificandSize - 1);   // = 2^(p-1)
    static constexpr bits_type SignificandMask         = HiddenBit - 1;                           // = 2^(p-1) - 1
    static constexpr bits_type ExponentMask            = MaxIeeeExponent << (SignificandSize - 1);
    static constexpr bits_type SignMask                = ~(~bits_type{0} >> 1);
    static constexpr bits_type InfinityBits            = ExponentMask;

    bits_type bits;

    explicit IEEE(bits_type bits_) : bits(bits_) {}
    explicit IEEE(value_type value) : bits(floatconv::impl::ReinterpretBits<bits_type>(value)) {}

    bits_type PhysicalSignificand() const {
        return bits & SignificandMask;
    }

    bits_type PhysicalExponent() const {
        return (bits & ExponentMask) >> (SignificandSize - 1);
    }

    bool IsFinite() const {
        return (bits & ExponentMask) != ExponentMask;
    }

    bool IsInf() const {
        return (bits & ExponentMask) == ExponentMask && (bits & SignificandMask) == 0;
    }

    bool IsNaN() const {
        return (bits & ExponentMask) == ExponentMask && (bits & SignificandMask) != 0;
    }

    bool IsZero() const {
        return (bits & ~SignMask) == 0;
    }

    bool SignBit() const {
        return (bits & SignMask) != 0;
    }

    value_type Value() const {
        return floatconv::impl::ReinterpretBits<value_type>(bits);
    }

    value_type AbsValue() const {
        return floatconv::impl::ReinterpretBits<value_type>(bits & ~SignMask);
    }
};

enum class FloatClass {
    zero,
    subnormal,
    normal,
    infinity,
    nan,
};

// The fields of an IEEE-754 value.
template <typename Float>
struct BinaryFloat
{
    using bits_type = typename IEEE<Float>::bits_type;

    bool       sign;
    bits_type  biased_exponent;
    bits_type  mantissa; // without the hidden bit
    FloatClass cls;

    bool IsFinite() const {
        return cls != FloatClass::infinity && cls != FloatClass::nan;
    }
};

template <typename Float>
inline BinaryFloat<Float> Decompose(Float value)
{
    using Traits = IEEE<Float>;

    const Traits v(value);

    BinaryFloat<Float> x;
    x.sign = v.SignBit();
    x.biased_exponent = v.PhysicalExponent();
    x.mantissa = v.PhysicalSignificand();

    if (x.biased_exponent == Traits::MaxIeeeExponent)
        x.cls = (x.mantissa == 0) ? FloatClass::infinity : FloatClass::nan;
    else if (x.biased_exponent == 0)
        x.cls = (x.mantissa == 0) ? FloatClass::zero : FloatClass::subnormal;
    else
        x.cls = FloatClass::normal;

    return x;
}

// Inverse of Decompose. The class field is ignored.
template <typename Float>
inline Float Compose(const BinaryFloat<Float>& x)
{
    using Traits = IEEE<Float>;
    using bits_type = typename Traits::bits_type;

    const bits_type bits = (x.sign ? Traits::SignMask : bits_type{0})
        | static_cast<bits_type>(x.biased_exponent << Traits::PhysicalSignificandSize)
        | (x.mantissa & Traits::SignificandMask);

    return floatconv::impl::ReinterpretBits<Float>(bits);
}

} // namespace floatconv
