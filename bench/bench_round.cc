#include "benchmark/benchmark.h"

#include "decround.h"

#include <double-conversion/double-conversion.h>

#include <cassert>
#include <cstdio>
#include <limits>
#include <random>
#include <string>
#include <vector>

static constexpr int NumFloats = 1 << 12;

static std::mt19937_64 rng;

static std::vector<std::string> GenUniformData_double(double min, double max)
{
    std::uniform_real_distribution<double> gen(min, max);

    std::vector<std::string> numbers(NumFloats);
    for (auto& str : numbers)
    {
        str = decround::Stringify(gen(rng));
    }

    return numbers;
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

struct S2DDecround
{
    double operator()(std::string const& str) const
    {
        auto const res = decround::ToDouble(decround::DecomposeString(str));
        assert(res.status == decround::ConversionStatus::ok);
        return res.value;
    }
};

struct S2DDoubleConversion
{
    double operator()(std::string const& str) const
    {
        double_conversion::StringToDoubleConverter s2d(0, 0.0, 1.0, "inf", "nan");
        int processed_characters_count = 0;
        return s2d.StringToDouble(str.data(), static_cast<int>(str.size()), &processed_characters_count);
    }
};

template <typename S2D>
static void BenchStrtod(benchmark::State& state, std::vector<std::string> const& numbers)
{
    size_t index = 0;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize(S2D{}(numbers[index]));
        index = (index + 1) & (NumFloats - 1);
    }
}

static void BenchRoundDecimal(benchmark::State& state, std::vector<std::string> const& numbers, int places)
{
    size_t index = 0;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize(decround::RoundDecimalString(numbers[index], places));
        index = (index + 1) & (NumFloats - 1);
    }
}

static void RegisterUniform_double(char const* name, double min, double max)
{
    auto const numbers = GenUniformData_double(min, max);

    benchmark::RegisterBenchmark((std::string(name) + " decround         ").c_str(), BenchStrtod<S2DDecround>, numbers);
    benchmark::RegisterBenchmark((std::string(name) + " double_conversion").c_str(), BenchStrtod<S2DDoubleConversion>, numbers);
    benchmark::RegisterBenchmark((std::string(name) + " round 2          ").c_str(), BenchRoundDecimal, numbers, 2);
}

static void RegisterLongInput(char const* name, std::string const& str, int places)
{
    std::vector<std::string> numbers(NumFloats, str);

    benchmark::RegisterBenchmark(name, BenchRoundDecimal, numbers, places);
}

int main(int argc, char** argv)
{
#if defined(__clang__)
    printf("clang %d.%d\n", __clang_major__, __clang_minor__);
#elif defined(__GNUC__)
    printf("gcc %s\n", __VERSION__);
#elif defined(_MSC_VER)
    printf("msc %d\n", _MSC_FULL_VER);
#endif

    RegisterUniform_double("warm up", 0, 1);

    RegisterUniform_double("uniform [0,1]", 0.0, 1.0);
    RegisterUniform_double("uniform [1,2]", 1.0, 2.0);
    RegisterUniform_double("uniform [2^20,2^50]", 1ll << 20, 1ll << 50);
    RegisterUniform_double("uniform [0,max]", 0.0, std::numeric_limits<double>::max());

    RegisterLongInput("max double, round 0", decround::Stringify(std::numeric_limits<double>::max()), 0);
    RegisterLongInput("min double, round 400", decround::Stringify(std::numeric_limits<double>::denorm_min()), 400);
    RegisterLongInput("4 * 10^1000, round 0", "4 * 10 ^ 1000", 0);

    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();

    return 0;
}
