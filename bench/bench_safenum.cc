#include "benchmark/benchmark.h"

#include <cstdio>
#include <cstring>

#include <algorithm>
#include <limits>
#include <random>
#include <string>
#include <vector>

#include "dragon4.h"
#include "safe_numeric.h"
#include "strtod.h"

static constexpr int NumStrings = 1 << 14;

struct IsSafeNumeric
{
    bool operator()(std::string const& str) const
    {
        return safenum::IsSafeNumeric(str);
    }
};

struct ToDouble
{
    double operator()(std::string const& str) const
    {
        safenum::ExactDecimal x;
        if (safenum::ParseExactDecimal(str.data(), str.data() + str.size(), x) != safenum::LexicalStatus::ok)
            return 0;
        return safenum::ToDouble(x);
    }
};

struct ToShortestDecimal
{
    size_t operator()(std::string const& str) const
    {
        safenum::ExactDecimal x;
        if (safenum::ParseExactDecimal(str.data(), str.data() + str.size(), x) != safenum::LexicalStatus::ok)
            return 0;
        return safenum::ToShortestDecimal(safenum::ToDouble(x)).digits.size();
    }
};

template <typename Op>
static void BenchIt(benchmark::State& state, std::vector<std::string> const& strings)
{
    Op op;

    size_t index = 0;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize( op(strings[index]) );
        index = (index + 1) & (NumStrings - 1);
    }
}

template <typename Op>
static void RegisterBenchmarks(std::string const& name, std::vector<std::string> const& strings)
{
    auto* bench = benchmark::RegisterBenchmark(name.c_str(), BenchIt<Op>, strings);

    bench->ComputeStatistics("min", [](std::vector<double> const& v) -> double {
        return *(std::min_element(std::begin(v), std::end(v)));
    });
    bench->ReportAggregatesOnly();
}

static std::mt19937 rng;

// Positional notation of value, as produced by printf("%.*f").
static std::string FixedString(double value, int precision)
{
    char buf[512];
    int const n = std::snprintf(buf, sizeof(buf), "%.*f", precision, value);
    return std::string(buf, static_cast<size_t>(n));
}

// Shortest positional notation of value. Always a safe numeric string.
static std::string ShortestString(double value)
{
    return safenum::ToString(safenum::ToShortestDecimal(value));
}

static void RegisterAll(std::string const& name, std::vector<std::string> const& strings)
{
    RegisterBenchmarks<IsSafeNumeric    >(name + " IsSafeNumeric     ", strings);
    RegisterBenchmarks<ToDouble         >(name + " ToDouble          ", strings);
    RegisterBenchmarks<ToShortestDecimal>(name + " ToShortestDecimal ", strings);
}

static void RegisterUniform(std::string const& name, double min, double max)
{
    std::uniform_real_distribution<double> gen(min, max);

    std::vector<std::string> shortest(NumStrings);
    std::generate(shortest.begin(), shortest.end(), [&] { return ShortestString(gen(rng)); });
    RegisterAll(name + " shortest", shortest);

    // 20 fractional digits: rejected by the round trip.
    std::vector<std::string> long_fraction(NumStrings);
    std::generate(long_fraction.begin(), long_fraction.end(), [&] { return FixedString(gen(rng), 20); });
    RegisterAll(name + " %.20f   ", long_fraction);
}

static void RegisterShortDecimals(std::string const& name, int num_fraction_digits)
{
    std::uniform_int_distribution<int> integer_gen(0, 99999);
    std::uniform_int_distribution<int> digit_gen(0, 9);

    std::vector<std::string> strings(NumStrings);
    std::generate(strings.begin(), strings.end(), [&] {
        std::string str = std::to_string(integer_gen(rng));
        if (num_fraction_digits > 0)
        {
            str += '.';
            for (int i = 0; i < num_fraction_digits; ++i)
                str += static_cast<char>('0' + digit_gen(rng));
        }
        return str;
    });

    RegisterAll(name, strings);
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

    RegisterUniform("warm up", 0, 1);

    RegisterUniform("uniform [0,1]", 0.0, 1.0);
    RegisterUniform("uniform [1,2^10]", 1.0, 1ll << 10);
    RegisterUniform("uniform [2^10,2^50]", 1ll << 10, 1ll << 50);

    RegisterShortDecimals("prices xxxxx.xx ", 2);
    RegisterShortDecimals("integers xxxxx  ", 0);
    RegisterShortDecimals("xxxxx.x{10}     ", 10);

    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();

    return 0;
}
