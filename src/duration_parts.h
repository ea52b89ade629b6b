// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "saturating.h"

#include <chrono>
#include <cstdint>
#include <limits>
#include <ratio>
#include <type_traits>

namespace dactyl {

// Longest span which can be printed: 49,710 days, 6 hours, 28 minutes and
// 15 seconds. Longer durations are clamped to this.
constexpr uint32_t kMaxDurationSeconds = std::numeric_limits<uint32_t>::max();

struct DurationParts
{
    uint32_t days = 0;
    uint8_t hours = 0;      // [0, 24)
    uint8_t minutes = 0;    // [0, 60)
    uint8_t seconds = 0;    // [0, 60)
    uint8_t hundredths = 0; // [0, 100)

    // At kMaxDurationSeconds the hundredths are dropped, so nothing exceeds Max().
    static DurationParts FromSeconds(uint32_t total_seconds, uint32_t hundredths = 0);

    // Any integer number of seconds. Negative values are clamped to 0.
    template <typename Int, typename std::enable_if<std::is_integral<Int>::value, int>::type = 0>
    static DurationParts FromSeconds(Int total_seconds)
    {
        return FromSeconds(SaturatingCast<uint32_t>(total_seconds), 0u);
    }

    // Truncated to hundredths of a second.
    template <typename Rep, typename Period>
    static DurationParts FromDuration(std::chrono::duration<Rep, Period> d)
    {
        using Seconds = std::chrono::duration<double>;
        using Hundredths = std::chrono::duration<int64_t, std::centi>;

        if (d <= std::chrono::duration<Rep, Period>::zero())
            return DurationParts{};

        // Compare in floating-point first, so that the conversions below
        // cannot overflow.
        if (std::chrono::duration_cast<Seconds>(d).count() >= static_cast<double>(kMaxDurationSeconds) + 1.0)
            return Max();

        const auto whole = std::chrono::duration_cast<std::chrono::seconds>(d);
        const auto hundredths = std::chrono::duration_cast<Hundredths>(d - whole);

        return FromSeconds(SaturatingCast<uint32_t>(whole.count()), SaturatingCast<uint32_t>(hundredths.count()));
    }

    static DurationParts Max() { return FromSeconds(kMaxDurationSeconds, 0u); }

    // Carries overflowing fields, hundredths included, into the next unit and
    // clamps the total to kMaxDurationSeconds.
    static DurationParts Normalize(const DurationParts& parts);

    // Whole seconds, ignoring the hundredths.
    uint64_t TotalSeconds() const;

    bool IsZero() const { return days == 0 && hours == 0 && minutes == 0 && seconds == 0 && hundredths == 0; }

    friend bool operator==(const DurationParts& lhs, const DurationParts& rhs)
    {
        return lhs.days == rhs.days
            && lhs.hours == rhs.hours
            && lhs.minutes == rhs.minutes
            && lhs.seconds == rhs.seconds
            && lhs.hundredths == rhs.hundredths;
    }

    friend bool operator!=(const DurationParts& lhs, const DurationParts& rhs) { return !(lhs == rhs); }
};

namespace impl {

// True if a duration type can carry fractions of a second.
template <typename Rep, typename Period>
struct HasSubsecondPrecision
    : std::integral_constant<bool, std::chrono::treat_as_floating_point<Rep>::value ||
                                   std::ratio_less<Period, std::ratio<1>>::value>
{
};

} // namespace impl

} // namespace dactyl
