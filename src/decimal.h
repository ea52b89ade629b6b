// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cstdint>

namespace dactyl {
namespace impl {

// A non-negative decimal value rounded to a fixed number of fractional
// digits: integer + fraction / 10^precision.
struct FixedDecimal
{
    uint64_t integer;
    uint32_t fraction;
};

constexpr int kMaxFixedPrecision = 9;

// Rounds |value| to `precision` fractional digits, half away from zero.
//
// Rounding is done on the shortest decimal representation which round-trips
// to value (as produced by std::to_chars). So 2.675 rounds to 2.68 even though
// the closest double is slightly less than 2.675.
//
// PRE: value is finite, |value| < 2^64, 0 <= precision <= kMaxFixedPrecision.
FixedDecimal RoundToFixed(double value, int precision);
FixedDecimal RoundToFixed(float value, int precision);

} // namespace impl
} // namespace dactyl
