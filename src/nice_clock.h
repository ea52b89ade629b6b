// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "duration_parts.h"
#include "fixed_text.h"

#include <chrono>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace dactyl {

// A duration as a zero-padded clock, e.g. 3723 seconds -> "01:02:03".
//
// Durations of a day or more get a "DD:" prefix ("02:00:00:01"). Durations
// with sub-second precision always get a ".ff" suffix ("00:00:01.50").
class NiceClock
{
public:
    static constexpr int MaxLength = 17; // "49710:06:28:15.00"

private:
    FixedText<MaxLength> text_;
    DurationParts parts_;
    bool with_hundredths_ = false;

public:
    NiceClock() : NiceClock(DurationParts{}, false) {}
    NiceClock(const DurationParts& parts, bool with_hundredths) { Replace(parts, with_hundredths); }

    template <typename Int, typename std::enable_if<std::is_integral<Int>::value, int>::type = 0>
    explicit NiceClock(Int seconds) { Replace(seconds); }

    template <typename Rep, typename Period>
    explicit NiceClock(std::chrono::duration<Rep, Period> d) { Replace(d); }

    template <typename Clock, typename Duration>
    static NiceClock Between(std::chrono::time_point<Clock, Duration> from, std::chrono::time_point<Clock, Duration> to)
    {
        return NiceClock(to - from);
    }

    template <typename Clock, typename Duration>
    static NiceClock Since(std::chrono::time_point<Clock, Duration> start)
    {
        return Between(start, std::chrono::time_point_cast<Duration>(Clock::now()));
    }

    static NiceClock Min() { return NiceClock(DurationParts{}, false); }
    static NiceClock Max() { return NiceClock(DurationParts::Max(), false); }

    void Replace(const DurationParts& parts, bool with_hundredths);

    template <typename Int, typename std::enable_if<std::is_integral<Int>::value, int>::type = 0>
    void Replace(Int seconds)
    {
        Replace(DurationParts::FromSeconds(seconds), false);
    }

    template <typename Rep, typename Period>
    void Replace(std::chrono::duration<Rep, Period> d)
    {
        Replace(DurationParts::FromDuration(d), impl::HasSubsecondPrecision<Rep, Period>::value);
    }

    uint32_t Days() const noexcept { return parts_.days; }
    uint8_t Hours() const noexcept { return parts_.hours; }
    uint8_t Minutes() const noexcept { return parts_.minutes; }
    uint8_t Seconds() const noexcept { return parts_.seconds; }
    uint8_t Hundredths() const noexcept { return parts_.hundredths; }
    const DurationParts& Parts() const noexcept { return parts_; }

    std::string_view Str() const noexcept { return text_.Str(); }
    const char* Data() const noexcept { return text_.Data(); }
    const unsigned char* Bytes() const noexcept { return text_.Bytes(); }
    int Size() const noexcept { return text_.Size(); }

    friend bool operator==(const NiceClock& lhs, const NiceClock& rhs) noexcept { return lhs.text_ == rhs.text_; }
    friend bool operator!=(const NiceClock& lhs, const NiceClock& rhs) noexcept { return lhs.text_ != rhs.text_; }
    friend bool operator<(const NiceClock& lhs, const NiceClock& rhs) noexcept { return lhs.text_ < rhs.text_; }
};

} // namespace dactyl
