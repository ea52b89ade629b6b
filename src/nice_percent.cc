// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "nice_percent.h"

#include "common.h"
#include "decimal.h"
#include "format_digits.h"
#include "ieee.h"

using namespace dactyl;

namespace {

constexpr uint64_t kMaxHundredths = 10000000000; // 100,000,000.00%

// Percent with two decimals == fraction with four decimals.
template <typename Float>
uint64_t ToHundredths(Float fraction)
{
    const IEEE<Float> ieee(fraction);

    if (ieee.IsNaN())
        return 0;
    if (ieee.IsInf())
        return ieee.SignBit() ? 0 : kMaxHundredths;
    if (ieee.SignBit() || ieee.IsZero())
        return 0;
    if (fraction >= static_cast<Float>(kPercentMaxFraction))
        return kMaxHundredths;

    const impl::FixedDecimal dec = impl::RoundToFixed(fraction, 4);
    return dec.integer * 10000 + dec.fraction;
}

} // namespace

void NicePercent::Replace(double fraction)
{
    PrintHundredths(ToHundredths(fraction));
}

void NicePercent::Replace(float fraction)
{
    PrintHundredths(ToHundredths(fraction));
}

void NicePercent::PrintHundredths(uint64_t hundredths)
{
    DACTYL_ASSERT(hundredths <= kMaxHundredths);

    char* ptr = text_.End();
    *--ptr = '%';
    ptr -= 2;
    impl::Utoa_2Digits(ptr, static_cast<uint32_t>(hundredths % 100));
    *--ptr = '.';
    ptr = impl::PrintGrouped(ptr, static_cast<uint32_t>(hundredths / 100));

    text_.AssignSuffix(ptr);
}
