#include "benchmark/benchmark.h"

#include "floatconv.h"

#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <algorithm>
#include <limits>
#include <random>
#include <string>
#include <vector>

static constexpr int NumFloats = 1 << 14;

static std::mt19937 random_engine;

template <typename Float>
static void BenchFromDecimalString(benchmark::State& state, std::vector<std::string> const& numbers)
{
    size_t index = 0;
    for (auto _ : state)
    {
        const auto res = floatconv::FromDecimalString<Float>(numbers[index]);
        benchmark::DoNotOptimize(res);
        index = (index + 1) & (NumFloats - 1);
    }
}

template <typename Float>
static void RegisterInputs(std::string const& name, std::vector<std::string> const& numbers)
{
    // All inputs must be valid, otherwise only the syntax check would be measured.
    for (auto const& str : numbers)
    {
        const auto res = floatconv::FromDecimalString<Float>(str);
        if (!res)
        {
            std::fprintf(stderr, "invalid input '%s': %s\n", str.c_str(), floatconv::ToString(res.status));
            std::exit(EXIT_FAILURE);
        }
    }

    const std::string full_name = std::string(sizeof(Float) == 4 ? "single" : "double") + " - " + name;

    auto* bench = benchmark::RegisterBenchmark(full_name.c_str(), BenchFromDecimalString<Float>, numbers);
    bench->ComputeStatistics("min", [](std::vector<double> const& v) -> double {
        return *std::min_element(v.begin(), v.end());
    });
    bench->Repetitions(3);
    bench->ReportAggregatesOnly();
}

// Shortest representations, as written by ToDecimalString.
template <typename Float>
static void RegisterShortest(char const* range, Float min, Float max)
{
    std::uniform_real_distribution<Float> gen(min, max);

    std::vector<std::string> numbers(NumFloats);
    std::generate(numbers.begin(), numbers.end(), [&] { return floatconv::ToDecimalString(gen(random_engine)); });

    RegisterInputs<Float>(std::string(range) + " - shortest", numbers);
}

// 20 significant digits, which is more than needed to round-trip and exercises the slow path.
static void RegisterLong(char const* range, double min, double max)
{
    std::uniform_real_distribution<double> gen(min, max);

    std::vector<std::string> numbers(NumFloats);
    std::generate(numbers.begin(), numbers.end(), [&] {
        char buf[64];
        const int len = std::snprintf(buf, sizeof(buf), "%.20g", gen(random_engine));
        return std::string(buf, static_cast<size_t>(len));
    });

    RegisterInputs<double>(std::string(range) + " - %.20g", numbers);
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

    RegisterShortest("uniform [0,1/2]", 0.0, 0.5);
    RegisterShortest("uniform [1/2,1]", 0.5, 1.0);
    RegisterShortest("uniform [0,1]", 0.0, 1.0);
    RegisterShortest("uniform [1,2]", 1.0, 2.0);
    RegisterShortest("uniform [8,2^10]", 8.0, 1024.0);
    RegisterShortest("uniform [2^10,2^20]", 1024.0, 1048576.0);
    RegisterShortest("uniform [2^20,2^50]", 1048576.0, 1125899906842624.0);
    RegisterShortest("uniform [0,max]", 0.0, std::numeric_limits<double>::max());

    RegisterShortest("uniform [0,1]", 0.0f, 1.0f);
    RegisterShortest("uniform [0,max]", 0.0f, std::numeric_limits<float>::max());

    RegisterLong("uniform [0,1]", 0.0, 1.0);
    RegisterLong("uniform [0,max]", 0.0, std::numeric_limits<double>::max());

    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();
}
