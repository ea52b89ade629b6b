// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cstdint>
#include <iosfwd>
#include <type_traits>

namespace dactyl {

enum class RatioStatus {
    ok,
    lossy,            // an operand was rounded when converted to double
    zero_denominator,
    not_finite,
};

const char* Name(RatioStatus status);
std::ostream& operator<<(std::ostream& os, RatioStatus status);

struct RatioResult
{
    double value;
    RatioStatus status;

    // true if value == e/d exactly.
    explicit operator bool() const noexcept { return status == RatioStatus::ok; }
};

RatioResult RatioUnsigned(uint64_t e, uint64_t d);
RatioResult RatioSigned(int64_t e, int64_t d);

// e / d as a double.
//
// Integer operands are reduced by their greatest common divisor first. On a
// zero denominator the value is NaN (0/0) or an infinity with the sign of e.
template <typename Int, typename std::enable_if<std::is_integral<Int>::value, int>::type = 0>
inline RatioResult Ratio(Int e, Int d)
{
    if (std::is_signed<Int>::value)
        return RatioSigned(static_cast<int64_t>(e), static_cast<int64_t>(d));
    else
        return RatioUnsigned(static_cast<uint64_t>(e), static_cast<uint64_t>(d));
}

RatioResult Ratio(double e, double d);

} // namespace dactyl
