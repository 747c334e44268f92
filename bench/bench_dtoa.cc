#include "benchmark/benchmark.h"

#include "floatconv.h"
#include "to_decimal.h"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <algorithm>
#include <random>
#include <string>
#include <vector>

static constexpr int NumFloats = 1 << 13;

static std::mt19937 random_engine;

template <typename Float>
static char const* TypeName()
{
    return sizeof(Float) == 4 ? "single" : "double";
}

// Cycles through the inputs, so that the branch predictor can't learn a single value.
template <typename Float>
static void BenchToChars(benchmark::State& state, std::vector<Float> const& numbers, floatconv::FormatDialect const& dialect)
{
    char buffer[floatconv::ToCharsMinBufferLength];

    size_t index = 0;
    for (auto _ : state)
    {
        char* end = floatconv::ToChars(buffer, buffer + sizeof(buffer), numbers[index], dialect);
        benchmark::DoNotOptimize(end);
        index = (index + 1) & (NumFloats - 1);
    }
}

template <typename Float>
static void BenchToDecimal(benchmark::State& state, std::vector<Float> const& numbers)
{
    size_t index = 0;
    for (auto _ : state)
    {
        const auto dec = floatconv::ToDecimal(numbers[index]);
        benchmark::DoNotOptimize(dec);
        index = (index + 1) & (NumFloats - 1);
    }
}

static void MinOfRepetitions(benchmark::internal::Benchmark* bench)
{
    bench->ComputeStatistics("min", [](std::vector<double> const& v) -> double {
        return *std::min_element(v.begin(), v.end());
    });
    bench->Repetitions(3);
    bench->ReportAggregatesOnly();
}

template <typename Float>
static void RegisterBenchmarks(std::string const& name, std::vector<Float> const& numbers)
{
    const std::string prefix = std::string(TypeName<Float>()) + " - " + name;

    MinOfRepetitions(benchmark::RegisterBenchmark((prefix + " - ToDecimal").c_str(),
        BenchToDecimal<Float>, numbers));
    MinOfRepetitions(benchmark::RegisterBenchmark((prefix + " - default").c_str(),
        BenchToChars<Float>, numbers, floatconv::FormatDialect::Default()));
    MinOfRepetitions(benchmark::RegisterBenchmark((prefix + " - compatibility").c_str(),
        BenchToChars<Float>, numbers, floatconv::FormatDialect::Compatibility()));
}

//==================================================================================================
// Inputs
//==================================================================================================

// Finite, non-zero bit patterns.
template <typename Float>
static void RegisterRandomBits()
{
    using bits_type = typename floatconv::IEEE<Float>::bits_type;

    std::uniform_int_distribution<bits_type> gen(1, floatconv::IEEE<Float>::InfinityBits - 1);

    std::vector<Float> numbers(NumFloats);
    std::generate(numbers.begin(), numbers.end(), [&] { return floatconv::IEEE<Float>(gen(random_engine)).Value(); });

    RegisterBenchmarks("random bits", numbers);
}

template <typename Float>
static void RegisterUniform(Float low, Float high)
{
    std::uniform_real_distribution<Float> gen(low, high);

    std::vector<Float> numbers(NumFloats);
    std::generate(numbers.begin(), numbers.end(), [&] { return gen(random_engine); });

    char name[64];
    std::snprintf(name, sizeof(name), "uniform [%g,%g]", static_cast<double>(low), static_cast<double>(high));
    RegisterBenchmarks(name, numbers);
}

// Numbers of the form 1.d_1...d_n, which have exactly n + 1 significant digits (unless d_n is 0).
template <typename Float>
static void RegisterRandomDigits(int digits)
{
    std::uniform_int_distribution<int> gen(0, 9);

    std::vector<Float> numbers(NumFloats);
    for (auto& value : numbers)
    {
        std::string str = "1.";
        for (int i = 0; i < digits; ++i)
            str += static_cast<char>('0' + gen(random_engine));

        const auto res = floatconv::FromDecimalString<Float>(str);
        if (!res)
        {
            std::fprintf(stderr, "invalid input '%s': %s\n", str.c_str(), floatconv::ToString(res.status));
            std::exit(EXIT_FAILURE);
        }
        value = res.value;
    }

    RegisterBenchmarks("1." + std::to_string(digits) + " digits", numbers);
}

int main(int argc, char** argv)
{
#if defined(__clang__)
    std::printf("clang %d.%d\n", __clang_major__, __clang_minor__);
#elif defined(__GNUC__)
    std::printf("gcc %s\n", __VERSION__);
#elif defined(_MSC_VER)
    std::printf("msc %d\n", _MSC_FULL_VER);
#endif

    RegisterRandomBits<double>();
    RegisterUniform(0.0, 1.0);
    RegisterUniform(0.0, 1.0e+308);
    RegisterUniform(1.0, 2.0);
    for (int d = 0; d <= 16; d += 4)
        RegisterRandomDigits<double>(d);

    RegisterRandomBits<float>();
    RegisterUniform(0.0f, 1.0f);
    RegisterUniform(0.0f, 1.0e+38f);
    for (int d = 0; d <= 8; d += 2)
        RegisterRandomDigits<float>(d);

    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();
}
