#include <catch2/catch.hpp>

#include "double-conversion/double-conversion.h"

#include "nice_float.h"

#include <cstdint>
#include <random>
#include <string>

using namespace dactyl;

//==================================================================================================
// Checks NiceFloat against double-conversion.
//==================================================================================================

static std::string Shortest_double_conversion(double value)
{
    using namespace double_conversion;

    char buf[64];
    const auto& conv = DoubleToStringConverter::EcmaScriptConverter();
    StringBuilder builder(buf, static_cast<int>(sizeof(buf)));
    conv.ToShortest(value, &builder);
    return std::string(buf, static_cast<size_t>(builder.position()));
}

static std::string Fixed_double_conversion(double value, int precision)
{
    using namespace double_conversion;

    char buf[128];
    const auto& conv = DoubleToStringConverter::EcmaScriptConverter();
    StringBuilder builder(buf, static_cast<int>(sizeof(buf)));
    conv.ToFixed(value, precision, &builder);
    return std::string(buf, static_cast<size_t>(builder.position()));
}

static std::string RemoveCommas(std::string_view str)
{
    std::string result;
    for (char ch : str)
    {
        if (ch != ',')
            result += ch;
    }
    return result;
}

static const double kPow10[] = {1e0, 1e1, 1e2, 1e3, 1e4, 1e5, 1e6, 1e7, 1e8};

// Values m / 10^k with at most 8 fractional digits print exactly like their
// shortest representation in compact mode.
TEST_CASE("NiceFloat - double-conversion shortest")
{
    std::mt19937_64 random;

    for (int i = 0; i < 100000; ++i)
    {
        const uint64_t m = random() % 1000000000000000; // < 10^15
        const int k = static_cast<int>(random() % 9);
        const double value = static_cast<double>(m) / kPow10[k];
        if (value < 1e-6)
            continue; // exponential notation

        CAPTURE(value);
        CHECK(RemoveCommas(NiceFloat(value).Compact()) == Shortest_double_conversion(value));
        CHECK(RemoveCommas(NiceFloat(-value).Compact()) == Shortest_double_conversion(-value));
    }
}

// Dyadic values m / 2^k (m < 2^24, k <= 8) have at most 8 fractional decimal
// digits and at most 16 significant digits, so no rounding takes place.
TEST_CASE("NiceFloat - double-conversion fixed")
{
    std::mt19937_64 random;

    for (int i = 0; i < 100000; ++i)
    {
        const uint64_t m = random() >> 40; // < 2^24
        const int k = static_cast<int>(random() % 9);
        const double value = static_cast<double>(m) / static_cast<double>(uint64_t{1} << k);
        if (value < 1e-6)
            continue;

        CAPTURE(value);
        CHECK(RemoveCommas(NiceFloat(value).Str()) == Fixed_double_conversion(value, kFloatPrecision));
    }
}
