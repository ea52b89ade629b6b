#include <catch2/catch.hpp>

#include "duration_parts.h"
#include "nice_clock.h"
#include "nice_elapsed.h"

#include <chrono>
#include <cstdint>
#include <limits>

using namespace dactyl;
using namespace std::chrono;

//==================================================================================================
// DurationParts
//==================================================================================================

static void CheckParts(const DurationParts& parts, uint32_t days, int hours, int minutes, int seconds, int hundredths)
{
    CHECK(parts.days == days);
    CHECK(static_cast<int>(parts.hours) == hours);
    CHECK(static_cast<int>(parts.minutes) == minutes);
    CHECK(static_cast<int>(parts.seconds) == seconds);
    CHECK(static_cast<int>(parts.hundredths) == hundredths);
}

TEST_CASE("DurationParts - Seconds")
{
    CheckParts(DurationParts::FromSeconds(0), 0, 0, 0, 0, 0);
    CheckParts(DurationParts::FromSeconds(59), 0, 0, 0, 59, 0);
    CheckParts(DurationParts::FromSeconds(3723), 0, 1, 2, 3, 0);
    CheckParts(DurationParts::FromSeconds(86399), 0, 23, 59, 59, 0);
    CheckParts(DurationParts::FromSeconds(86400), 1, 0, 0, 0, 0);
    CheckParts(DurationParts::FromSeconds(kMaxDurationSeconds), 49710, 6, 28, 15, 0);
    CheckParts(DurationParts::Max(), 49710, 6, 28, 15, 0);

    // Clamped.
    CheckParts(DurationParts::FromSeconds(-1), 0, 0, 0, 0, 0);
    CheckParts(DurationParts::FromSeconds(std::numeric_limits<int64_t>::min()), 0, 0, 0, 0, 0);
    CheckParts(DurationParts::FromSeconds(uint64_t{kMaxDurationSeconds} + 1), 49710, 6, 28, 15, 0);
    CheckParts(DurationParts::FromSeconds(std::numeric_limits<uint64_t>::max()), 49710, 6, 28, 15, 0);

    CHECK(DurationParts::FromSeconds(3723).TotalSeconds() == 3723);
    CHECK(DurationParts::Max().TotalSeconds() == kMaxDurationSeconds);
    CHECK(DurationParts{}.IsZero());
    CHECK(!DurationParts::FromSeconds(1).IsZero());
}

TEST_CASE("DurationParts - Duration")
{
    CheckParts(DurationParts::FromDuration(milliseconds(0)), 0, 0, 0, 0, 0);
    CheckParts(DurationParts::FromDuration(milliseconds(9)), 0, 0, 0, 0, 0);
    CheckParts(DurationParts::FromDuration(milliseconds(10)), 0, 0, 0, 0, 1);
    CheckParts(DurationParts::FromDuration(milliseconds(61999)), 0, 0, 1, 1, 99);
    CheckParts(DurationParts::FromDuration(nanoseconds(1999999999)), 0, 0, 0, 1, 99);
    CheckParts(DurationParts::FromDuration(hours(25)), 1, 1, 0, 0, 0);
    CheckParts(DurationParts::FromDuration(duration<double>(1.25)), 0, 0, 0, 1, 25);

    // Negative durations are zero.
    CheckParts(DurationParts::FromDuration(milliseconds(-1500)), 0, 0, 0, 0, 0);
    CheckParts(DurationParts::FromDuration(duration<double>(-3.0)), 0, 0, 0, 0, 0);

    CheckParts(DurationParts::FromDuration(seconds(kMaxDurationSeconds - 1) + milliseconds(500)), 49710, 6, 28, 14, 50);

    // Longer durations are clamped, without hundredths.
    CheckParts(DurationParts::FromDuration(seconds(kMaxDurationSeconds) + milliseconds(10)), 49710, 6, 28, 15, 0);
    CheckParts(DurationParts::FromDuration(seconds(kMaxDurationSeconds) + milliseconds(990)), 49710, 6, 28, 15, 0);
    CheckParts(DurationParts::FromDuration(duration<double>(kMaxDurationSeconds + 0.5)), 49710, 6, 28, 15, 0);
    CheckParts(DurationParts::FromSeconds(kMaxDurationSeconds, 99u), 49710, 6, 28, 15, 0);
    CheckParts(DurationParts::FromDuration(seconds(int64_t{kMaxDurationSeconds} + 1)), 49710, 6, 28, 15, 0);
    CheckParts(DurationParts::FromDuration(hours(24 * 60000)), 49710, 6, 28, 15, 0);
    CheckParts(DurationParts::FromDuration(nanoseconds::max()), 49710, 6, 28, 15, 0);
    CheckParts(DurationParts::FromDuration(duration<double>(1e300)), 49710, 6, 28, 15, 0);
}

TEST_CASE("DurationParts - Normalize")
{
    DurationParts parts;
    parts.hours = 25;
    parts.minutes = 61;
    parts.seconds = 75;
    CheckParts(DurationParts::Normalize(parts), 1, 2, 2, 15, 0);

    parts = DurationParts{};
    parts.days = std::numeric_limits<uint32_t>::max();
    CheckParts(DurationParts::Normalize(parts), 49710, 6, 28, 15, 0);

    // Hundredths carry into seconds.
    parts = DurationParts{};
    parts.hundredths = 150;
    CheckParts(DurationParts::Normalize(parts), 0, 0, 0, 1, 50);

    parts = DurationParts{};
    parts.seconds = 59;
    parts.hundredths = 255;
    CheckParts(DurationParts::Normalize(parts), 0, 0, 1, 1, 55);

    // At the limit the hundredths are dropped.
    parts = DurationParts::Max();
    parts.hundredths = 99;
    CheckParts(DurationParts::Normalize(parts), 49710, 6, 28, 15, 0);

    parts = DurationParts::FromSeconds(kMaxDurationSeconds - 1, 0u);
    parts.hundredths = 100;
    CheckParts(DurationParts::Normalize(parts), 49710, 6, 28, 15, 0);

    parts = DurationParts::FromSeconds(kMaxDurationSeconds - 1, 0u);
    parts.hundredths = 99;
    CheckParts(DurationParts::Normalize(parts), 49710, 6, 28, 14, 99);
}

//==================================================================================================
// NiceElapsed
//==================================================================================================

template <typename T>
static void CheckElapsed(T value, std::string_view expected)
{
    const NiceElapsed nice(value);
    CHECK(nice.Str() == expected);
    CHECK(nice.Size() == static_cast<int>(expected.size()));
    CHECK(nice.Size() <= NiceElapsed::MaxLength);
}

TEST_CASE("NiceElapsed - Seconds")
{
    CheckElapsed(0, "0 seconds");
    CheckElapsed(1, "1 second");
    CheckElapsed(2, "2 seconds");
    CheckElapsed(59, "59 seconds");
    CheckElapsed(60, "1 minute");
    CheckElapsed(61, "1 minute and 1 second");
    CheckElapsed(62, "1 minute and 2 seconds");
    CheckElapsed(120, "2 minutes");
    CheckElapsed(3600, "1 hour");
    CheckElapsed(3601, "1 hour and 1 second");
    CheckElapsed(3660, "1 hour and 1 minute");
    CheckElapsed(3661, "1 hour, 1 minute, and 1 second");
    CheckElapsed(3723, "1 hour, 2 minutes, and 3 seconds");
    CheckElapsed(7200, "2 hours");
    CheckElapsed(86400, "1 day");
    CheckElapsed(86401, "1 day and 1 second");
    CheckElapsed(86461, "1 day, 1 minute, and 1 second");
    CheckElapsed(90000, "1 day and 1 hour");
    CheckElapsed(172800, "2 days");
    CheckElapsed(428390, "4 days, 22 hours, 59 minutes, and 50 seconds");
    CheckElapsed(878428390, "10,166 days, 23 hours, 53 minutes, and 10 seconds");
}

TEST_CASE("NiceElapsed - Saturation")
{
    CheckElapsed(kMaxDurationSeconds, "49,710 days, 6 hours, 28 minutes, and 15 seconds");
    CheckElapsed(uint64_t{kMaxDurationSeconds} + 1, "49,710 days, 6 hours, 28 minutes, and 15 seconds");
    CheckElapsed(std::numeric_limits<uint64_t>::max(), "49,710 days, 6 hours, 28 minutes, and 15 seconds");
    CheckElapsed(-1, "0 seconds");
    CheckElapsed(std::numeric_limits<int64_t>::min(), "0 seconds");

    CHECK(NiceElapsed::Max().Str() == "49,710 days, 6 hours, 28 minutes, and 15 seconds");
    CHECK(NiceElapsed::Min().Str() == "0 seconds");
    CHECK(NiceElapsed().Str() == "0 seconds");

    // Fractions of a second past the limit are dropped.
    const NiceElapsed over(seconds(kMaxDurationSeconds) + milliseconds(990));
    CHECK(over.Str() == "49,710 days, 6 hours, 28 minutes, and 15 seconds");
    CHECK(over == NiceElapsed::Max());
    CHECK(over.Parts() == DurationParts::Max());
    CHECK(!(NiceElapsed::Max() < over));
}

TEST_CASE("NiceElapsed - Duration")
{
    CheckElapsed(milliseconds(0), "0 seconds");
    CheckElapsed(milliseconds(1), "0 seconds");
    CheckElapsed(milliseconds(10), "0.01 seconds");
    CheckElapsed(milliseconds(20), "0.02 seconds");
    CheckElapsed(milliseconds(100), "0.10 seconds");
    CheckElapsed(milliseconds(1000), "1 second");
    CheckElapsed(milliseconds(1010), "1.01 seconds");
    CheckElapsed(milliseconds(1500), "1.50 seconds");
    CheckElapsed(milliseconds(60001), "1 minute");
    CheckElapsed(milliseconds(60340), "1 minute and 0.34 seconds");
    CheckElapsed(milliseconds(61999), "1 minute and 1.99 seconds");
    CheckElapsed(milliseconds(3600300), "1 hour and 0.30 seconds");
    CheckElapsed(milliseconds(37740030), "10 hours, 29 minutes, and 0.03 seconds");
    CheckElapsed(milliseconds(878428390999), "10,166 days, 23 hours, 53 minutes, and 10.99 seconds");
    CheckElapsed(milliseconds(-1500), "0 seconds");
    CheckElapsed(seconds(3723), "1 hour, 2 minutes, and 3 seconds");
    CheckElapsed(minutes(61), "1 hour and 1 minute");
    CheckElapsed(duration<double>(2.5), "2.50 seconds");
    CheckElapsed(hours(24 * 60000), "49,710 days, 6 hours, 28 minutes, and 15 seconds");
}

TEST_CASE("NiceElapsed - Longest")
{
    CheckElapsed(seconds(int64_t{49709} * 86400 + 86399) + milliseconds(990), "49,709 days, 23 hours, 59 minutes, and 59.99 seconds");
}

TEST_CASE("NiceElapsed - Parts")
{
    DurationParts parts;
    parts.hours = 25;
    parts.seconds = 1;

    const NiceElapsed nice(parts);
    CHECK(nice.Str() == "1 day, 1 hour, and 1 second");
    CheckParts(nice.Parts(), 1, 1, 0, 1, 0);

    CheckParts(NiceElapsed(milliseconds(61999)).Parts(), 0, 0, 1, 1, 99);
}

TEST_CASE("NiceElapsed - Between")
{
    const steady_clock::time_point start = steady_clock::now();

    CHECK(NiceElapsed::Between(start, start + seconds(61)).Str() == "1 minute and 1 second");
    CHECK(NiceElapsed::Between(start, start + milliseconds(1500)).Str() == "1.50 seconds");
    // Backwards.
    CHECK(NiceElapsed::Between(start + seconds(61), start).Str() == "0 seconds");

    const NiceElapsed since = NiceElapsed::Since(start);
    CHECK(since.Parts().days == 0);
    CHECK(since.Size() > 0);
}

TEST_CASE("NiceElapsed - Replace")
{
    NiceElapsed nice = NiceElapsed::Max();

    nice.Replace(61);
    CHECK(nice.Str() == "1 minute and 1 second");
    CHECK(nice == NiceElapsed(61));

    nice.Replace(milliseconds(20));
    CHECK(nice.Str() == "0.02 seconds");

    nice.Replace(DurationParts{});
    CHECK(nice == NiceElapsed::Min());
}

//==================================================================================================
// NiceClock
//==================================================================================================

template <typename T>
static void CheckClock(T value, std::string_view expected)
{
    const NiceClock nice(value);
    CHECK(nice.Str() == expected);
    CHECK(nice.Size() == static_cast<int>(expected.size()));
    CHECK(nice.Size() <= NiceClock::MaxLength);
}

TEST_CASE("NiceClock - Seconds")
{
    CheckClock(0, "00:00:00");
    CheckClock(1, "00:00:01");
    CheckClock(59, "00:00:59");
    CheckClock(60, "00:01:00");
    CheckClock(3723, "01:02:03");
    CheckClock(86399, "23:59:59");
    CheckClock(86400, "01:00:00:00");
    CheckClock(2 * 86400 + 1, "02:00:00:01");
    CheckClock(10 * 86400, "10:00:00:00");
    CheckClock(878428390, "10166:23:53:10");
    CheckClock(kMaxDurationSeconds, "49710:06:28:15");
    CheckClock(std::numeric_limits<uint64_t>::max(), "49710:06:28:15");
    CheckClock(-1, "00:00:00");

    CHECK(NiceClock().Str() == "00:00:00");
    CHECK(NiceClock::Min().Str() == "00:00:00");
    CHECK(NiceClock::Max().Str() == "49710:06:28:15");
}

TEST_CASE("NiceClock - Duration")
{
    // Whole seconds or coarser: no hundredths.
    CheckClock(seconds(5), "00:00:05");
    CheckClock(minutes(2), "00:02:00");
    CheckClock(hours(49), "02:01:00:00");

    // Finer than a second: always with hundredths.
    CheckClock(milliseconds(0), "00:00:00.00");
    CheckClock(milliseconds(1500), "00:00:01.50");
    CheckClock(milliseconds(3723010), "01:02:03.01");
    CheckClock(microseconds(999999), "00:00:00.99");
    CheckClock(duration<double>(1.25), "00:00:01.25");
    CheckClock(milliseconds(-5), "00:00:00.00");
    CheckClock(milliseconds(int64_t{kMaxDurationSeconds} * 1000 - 10), "49710:06:28:14.99");
    CheckClock(milliseconds(int64_t{kMaxDurationSeconds} * 1000 + 990), "49710:06:28:15.00");
    CheckClock(milliseconds(int64_t{kMaxDurationSeconds} * 1000 + 1000), "49710:06:28:15.00");

    const NiceClock over(seconds(kMaxDurationSeconds) + milliseconds(990));
    CHECK(over.Parts() == DurationParts::Max());
    CHECK(over.Hundredths() == 0);
    CHECK(over == NiceClock(DurationParts::Max(), true));
}

TEST_CASE("NiceClock - Fields")
{
    const NiceClock nice(93784);
    CHECK(nice.Str() == "01:02:03:04");
    CHECK(nice.Days() == 1);
    CHECK(nice.Hours() == 2);
    CHECK(nice.Minutes() == 3);
    CHECK(nice.Seconds() == 4);
    CHECK(nice.Hundredths() == 0);

    const NiceClock ms(milliseconds(3723450));
    CHECK(ms.Days() == 0);
    CHECK(ms.Hours() == 1);
    CHECK(ms.Minutes() == 2);
    CHECK(ms.Seconds() == 3);
    CHECK(ms.Hundredths() == 45);
}

TEST_CASE("NiceClock - Between")
{
    const steady_clock::time_point start = steady_clock::now();

    // steady_clock has sub-second precision.
    CHECK(NiceClock::Between(start, start + seconds(3723)).Str() == "01:02:03.00");

    const NiceClock since = NiceClock::Since(start);
    CHECK(since.Days() == 0);
}

TEST_CASE("NiceClock - Replace")
{
    NiceClock nice = NiceClock::Max();

    nice.Replace(3723);
    CHECK(nice.Str() == "01:02:03");
    CHECK(nice == NiceClock(3723));

    nice.Replace(milliseconds(1500));
    CHECK(nice.Str() == "00:00:01.50");

    nice.Replace(5);
    CHECK(nice.Str() == "00:00:05");

    DurationParts parts;
    parts.minutes = 90;
    nice.Replace(parts, true);
    CHECK(nice.Str() == "01:30:00.00");
}
