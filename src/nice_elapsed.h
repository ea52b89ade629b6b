// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "duration_parts.h"
#include "fixed_text.h"

#include <chrono>
#include <string_view>
#include <type_traits>

namespace dactyl {

// A duration in plain English, e.g. 3723 seconds -> "1 hour, 2 minutes, and 3 seconds".
//
// Only non-zero units are listed. Fractional seconds are printed with two
// decimals ("0.02 seconds"), a zero duration prints as "0 seconds".
class NiceElapsed
{
public:
    // Longest output is 52 bytes, e.g. "49,709 days, 23 hours, 59 minutes, and 59.99 seconds".
    static constexpr int MaxLength = 56;

private:
    FixedText<MaxLength> text_;
    DurationParts parts_;

public:
    NiceElapsed() : NiceElapsed(DurationParts{}) {}
    explicit NiceElapsed(const DurationParts& parts) { Replace(parts); }

    template <typename Int, typename std::enable_if<std::is_integral<Int>::value, int>::type = 0>
    explicit NiceElapsed(Int seconds) { Replace(DurationParts::FromSeconds(seconds)); }

    template <typename Rep, typename Period>
    explicit NiceElapsed(std::chrono::duration<Rep, Period> d) { Replace(DurationParts::FromDuration(d)); }

    template <typename Clock, typename Duration>
    static NiceElapsed Between(std::chrono::time_point<Clock, Duration> from, std::chrono::time_point<Clock, Duration> to)
    {
        return NiceElapsed(to - from);
    }

    template <typename Clock, typename Duration>
    static NiceElapsed Since(std::chrono::time_point<Clock, Duration> start)
    {
        return Between(start, std::chrono::time_point_cast<Duration>(Clock::now()));
    }

    static NiceElapsed Min() { return NiceElapsed(DurationParts{}); }
    static NiceElapsed Max() { return NiceElapsed(DurationParts::Max()); }

    // Parts out of range are normalized, and clamped to kMaxDurationSeconds.
    void Replace(const DurationParts& parts);

    template <typename Int, typename std::enable_if<std::is_integral<Int>::value, int>::type = 0>
    void Replace(Int seconds) { Replace(DurationParts::FromSeconds(seconds)); }

    template <typename Rep, typename Period>
    void Replace(std::chrono::duration<Rep, Period> d) { Replace(DurationParts::FromDuration(d)); }

    const DurationParts& Parts() const noexcept { return parts_; }

    std::string_view Str() const noexcept { return text_.Str(); }
    const char* Data() const noexcept { return text_.Data(); }
    const unsigned char* Bytes() const noexcept { return text_.Bytes(); }
    int Size() const noexcept { return text_.Size(); }

    friend bool operator==(const NiceElapsed& lhs, const NiceElapsed& rhs) noexcept { return lhs.text_ == rhs.text_; }
    friend bool operator!=(const NiceElapsed& lhs, const NiceElapsed& rhs) noexcept { return lhs.text_ != rhs.text_; }
    friend bool operator<(const NiceElapsed& lhs, const NiceElapsed& rhs) noexcept { return lhs.text_ < rhs.text_; }
};

} // namespace dactyl
