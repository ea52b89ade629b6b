// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cstdint>
#include <limits>
#include <type_traits>

namespace dactyl {

namespace impl {

template <typename Int>
constexpr bool IsNegative(Int value, std::true_type /*is_signed*/) { return value < 0; }

template <typename Int>
constexpr bool IsNegative(Int /*value*/, std::false_type /*is_signed*/) { return false; }

} // namespace impl

// Converts value to To, clamping to [To::min, To::max] instead of wrapping.
//
//  SaturatingCast<uint8_t>(300)    == 255
//  SaturatingCast<uint32_t>(-1)    == 0
//  SaturatingCast<int8_t>(-1000)   == -128
template <typename To, typename From>
constexpr To SaturatingCast(From value)
{
    static_assert(std::is_integral<To>::value && std::is_integral<From>::value, "integer types required");

    using ToLimits = std::numeric_limits<To>;

    if (impl::IsNegative(value, std::is_signed<From>{}))
    {
        if (static_cast<intmax_t>(value) < static_cast<intmax_t>(ToLimits::min()))
            return ToLimits::min();
        return static_cast<To>(value);
    }

    if (static_cast<uintmax_t>(value) > static_cast<uintmax_t>(ToLimits::max()))
        return ToLimits::max();
    return static_cast<To>(value);
}

} // namespace dactyl
