// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "decimal.h"

#include "common.h"
#include "ieee.h"

#include <charconv>
#include <system_error>

using namespace dactyl;
using namespace dactyl::impl;

namespace {

constexpr uint32_t kPow10[kMaxFixedPrecision + 1] = {
    1, 10, 100, 1000, 10000, 100000, 1000000, 10000000, 100000000, 1000000000,
};

// Shortest round-trip digits d1 d2 ... dn and the decimal exponent of d1,
// i.e. value = 0.d1d2...dn * 10^(exponent + 1).
struct ShortestDigits
{
    char digits[20];
    int num_digits;
    int exponent;

    int DigitAt(int index) const
    {
        if (index < 0 || index >= num_digits)
            return 0;
        return digits[index] - '0';
    }
};

template <typename Float>
ShortestDigits ToShortestDigits(Float value)
{
    // Longest output is "d.ddddddddddddddddde-308".
    char buf[32];
    const std::to_chars_result res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
    DACTYL_ASSERT(res.ec == std::errc());

    ShortestDigits sd;
    sd.num_digits = 0;

    const char* ptr = buf;
    const char* const last = res.ptr;
    for ( ; ptr != last && *ptr != 'e'; ++ptr)
    {
        if (*ptr == '.')
            continue;
        DACTYL_ASSERT(sd.num_digits < 20);
        sd.digits[sd.num_digits++] = *ptr;
    }

    DACTYL_ASSERT(ptr != last);
    ++ptr; // 'e'

    const bool negative_exponent = (*ptr == '-');
    ++ptr; // sign

    int exponent = 0;
    for ( ; ptr != last; ++ptr)
    {
        exponent = 10 * exponent + (*ptr - '0');
    }

    sd.exponent = negative_exponent ? -exponent : exponent;
    return sd;
}

template <typename Float>
FixedDecimal RoundToFixedImpl(Float value, int precision)
{
    DACTYL_ASSERT(precision >= 0);
    DACTYL_ASSERT(precision <= kMaxFixedPrecision);

    const IEEE<Float> ieee(value);
    DACTYL_ASSERT(ieee.IsFinite());

    const Float abs = ieee.AbsValue();
    if (abs == 0)
        return {0, 0};

    // Large values are integers and may have more significant digits than
    // their shortest representation. Use the exact value.
    if (abs >= IEEE<Float>::MinIntegral())
    {
        DACTYL_ASSERT(abs < static_cast<Float>(18446744073709551616.0));
        return {static_cast<uint64_t>(abs), 0};
    }

    const ShortestDigits sd = ToShortestDigits(abs);

    // Number of digits in front of the decimal point. May be <= 0.
    const int point = sd.exponent + 1;
    DACTYL_ASSERT(point <= 17);

    uint64_t integer = 0;
    for (int i = 0; i < point; ++i)
    {
        integer = 10 * integer + static_cast<uint32_t>(sd.DigitAt(i));
    }

    uint32_t fraction = 0;
    for (int i = point; i < point + precision; ++i)
    {
        fraction = 10 * fraction + static_cast<uint32_t>(sd.DigitAt(i));
    }

    if (sd.DigitAt(point + precision) >= 5)
    {
        ++fraction;
        if (fraction == kPow10[precision])
        {
            fraction = 0;
            ++integer;
        }
    }

    return {integer, fraction};
}

} // namespace

FixedDecimal dactyl::impl::RoundToFixed(double value, int precision)
{
    return RoundToFixedImpl(value, precision);
}

FixedDecimal dactyl::impl::RoundToFixed(float value, int precision)
{
    return RoundToFixedImpl(value, precision);
}
