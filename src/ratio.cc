// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "ratio.h"

#include <cmath>
#include <limits>
#include <numeric>
#include <ostream>

using namespace dactyl;

// Returns whether v converts to double without rounding.
static bool IsExactDouble(uint64_t v)
{
    if (v <= (uint64_t{1} << 53))
        return true;

    while ((v & 1) == 0)
    {
        v >>= 1;
    }
    return v < (uint64_t{1} << 53);
}

const char* dactyl::Name(RatioStatus status)
{
    switch (status)
    {
    case RatioStatus::ok:
        return "ok";
    case RatioStatus::lossy:
        return "lossy";
    case RatioStatus::zero_denominator:
        return "zero denominator";
    case RatioStatus::not_finite:
        return "not finite";
    }
    return "unknown";
}

std::ostream& dactyl::operator<<(std::ostream& os, RatioStatus status)
{
    return os << Name(status);
}

RatioResult dactyl::RatioUnsigned(uint64_t e, uint64_t d)
{
    if (d == 0)
    {
        const double value = (e == 0) ? std::numeric_limits<double>::quiet_NaN() : std::numeric_limits<double>::infinity();
        return {value, RatioStatus::zero_denominator};
    }

    if (e == 0)
        return {0.0, RatioStatus::ok};

    const uint64_t g = std::gcd(e, d);
    e /= g;
    d /= g;

    const double value = static_cast<double>(e) / static_cast<double>(d);
    const bool exact = IsExactDouble(e) && IsExactDouble(d);

    return {value, exact ? RatioStatus::ok : RatioStatus::lossy};
}

RatioResult dactyl::RatioSigned(int64_t e, int64_t d)
{
    // Magnitudes; well-defined for INT64_MIN.
    const uint64_t abs_e = (e < 0) ? 0 - static_cast<uint64_t>(e) : static_cast<uint64_t>(e);
    const uint64_t abs_d = (d < 0) ? 0 - static_cast<uint64_t>(d) : static_cast<uint64_t>(d);

    RatioResult res = RatioUnsigned(abs_e, abs_d);
    if (e != 0 && (e < 0) != (d < 0))
    {
        res.value = -res.value;
    }
    return res;
}

RatioResult dactyl::Ratio(double e, double d)
{
    const double value = e / d;
    if (d == 0)
        return {value, RatioStatus::zero_denominator};

    if (!std::isfinite(value))
        return {value, RatioStatus::not_finite};

    return {value, RatioStatus::ok};
}
