#include <catch2/catch.hpp>

#include "floatconv.h"
#include "to_decimal.h"

#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace floatconv;

static uint64_t BitsFromDouble(double f)
{
    uint64_t u;
    std::memcpy(&u, &f, sizeof(uint64_t));
    return u;
}

static uint32_t BitsFromSingle(float f)
{
    uint32_t u;
    std::memcpy(&u, &f, sizeof(uint32_t));
    return u;
}

static double DoubleFromBits(uint64_t bits)
{
    double f;
    std::memcpy(&f, &bits, sizeof(uint64_t));
    return f;
}

static float SingleFromBits(uint32_t bits)
{
    float f;
    std::memcpy(&f, &bits, sizeof(uint32_t));
    return f;
}

static bool RoundTrips(double value, const FormatDialect& dialect)
{
    const std::string str = ToDecimalString(value, dialect);
    const auto res = FromDecimalString<double>(str, dialect);
    if (!res || res.next != str.data() + str.size())
        return false;

    if (std::isnan(value))
        return std::isnan(res.value);

    return BitsFromDouble(res.value) == BitsFromDouble(value);
}

static bool RoundTrips(float value, const FormatDialect& dialect)
{
    const std::string str = ToDecimalString(value, dialect);
    const auto res = FromDecimalString<float>(str, dialect);
    if (!res || res.next != str.data() + str.size())
        return false;

    if (std::isnan(value))
        return std::isnan(res.value);

    return BitsFromSingle(res.value) == BitsFromSingle(value);
}

TEST_CASE("Roundtrip - random doubles")
{
    std::mt19937_64 random;

    for (int i = 0; i < 200000; ++i)
    {
        const double value = DoubleFromBits(random());
        CAPTURE(value);
        CHECK(RoundTrips(value, FormatDialect::Default()));
        CHECK(RoundTrips(value, FormatDialect::Compatibility()));
    }
}

TEST_CASE("Roundtrip - random floats")
{
    std::mt19937 random;

    for (int i = 0; i < 200000; ++i)
    {
        const float value = SingleFromBits(random());
        CAPTURE(value);
        CHECK(RoundTrips(value, FormatDialect::Default()));
        CHECK(RoundTrips(value, FormatDialect::Compatibility()));
    }
}

TEST_CASE("Roundtrip - decimal values")
{
    // Short decimals are printed as written.
    std::mt19937_64 random;
    std::uniform_int_distribution<int> gen_digits(1, 15);
    std::uniform_int_distribution<int> gen_exponent(-300, 290);

    for (int i = 0; i < 20000; ++i)
    {
        const int num_digits = gen_digits(random);
        std::string digits(1, static_cast<char>('1' + random() % 9));
        for (int k = 1; k < num_digits; ++k)
            digits += static_cast<char>('0' + random() % 10);
        while (digits.size() > 1 && digits.back() == '0')
            digits.pop_back();

        const std::string input = digits + "e" + std::to_string(gen_exponent(random));
        CAPTURE(input);

        const auto res = FromDecimalString<double>(input);
        REQUIRE(res);

        const DecimalDigits dec = ToDecimal(res.value);
        CHECK(std::to_string(dec.significand) == digits);
    }
}

TEST_CASE("Roundtrip - sign")
{
    const double values[] = {
        0.0,
        1.0,
        0.1,
        std::numeric_limits<double>::denorm_min(),
        std::numeric_limits<double>::max(),
        std::numeric_limits<double>::infinity(),
    };

    for (double v : values)
    {
        CAPTURE(v);
        for (const FormatDialect* dialect : {&FormatDialect::Default(), &FormatDialect::Compatibility()})
        {
            const std::string pos = ToDecimalString(v, *dialect);
            const std::string neg = ToDecimalString(-v, *dialect);
            CHECK(neg == "-" + pos);

            const auto res = FromDecimalString<double>(neg, *dialect);
            REQUIRE(res);
            CHECK(std::signbit(res.value));
        }
    }
}

// Returns the significand scaled to 17 digits.
static uint64_t Normalized(const DecimalDigits& dec)
{
    uint64_t s = dec.significand;
    for (int32_t n = dec.num_digits; n < 17; ++n)
        s *= 10;
    return s;
}

TEST_CASE("Roundtrip - ordering")
{
    // Adjacent doubles give distinct, ordered decimal representations.
    std::mt19937_64 random;

    for (int i = 0; i < 100000; ++i)
    {
        const uint64_t bits = random() % 0x7FEFFFFFFFFFFFFFu;
        const double lo = DoubleFromBits(bits);
        const double hi = DoubleFromBits(bits + 1);
        CAPTURE(lo);

        const DecimalDigits dec_lo = ToDecimal(lo);
        const DecimalDigits dec_hi = ToDecimal(hi);
        if (bits == 0)
        {
            CHECK(dec_hi.significand != 0);
            continue;
        }

        const bool ordered = dec_lo.exponent < dec_hi.exponent
            || (dec_lo.exponent == dec_hi.exponent && Normalized(dec_lo) < Normalized(dec_hi));
        CHECK(ordered);
    }
}

TEST_CASE("Roundtrip - threads")
{
    // The conversions have no shared mutable state; the power table is built once.
    const int num_threads = 4;
    std::vector<int> failures(num_threads, 0);

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t)
    {
        threads.emplace_back([t, &failures] {
            std::mt19937_64 random(static_cast<uint64_t>(t) + 1);
            for (int i = 0; i < 20000; ++i)
            {
                const double value = DoubleFromBits(random());
                if (!RoundTrips(value, FormatDialect::Default()))
                    failures[static_cast<size_t>(t)]++;
            }
        });
    }

    for (auto& thread : threads)
        thread.join();

    for (int t = 0; t < num_threads; ++t)
        CHECK(failures[static_cast<size_t>(t)] == 0);
}
