// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "nice_elapsed.h"

#include "common.h"
#include "format_digits.h"
#include "nice_int.h"

#include <cstring>

using namespace dactyl;

namespace {

struct Unit
{
    const char* name; // singular
    int length;
};

constexpr Unit kDay    = {"day", 3};
constexpr Unit kHour   = {"hour", 4};
constexpr Unit kMinute = {"minute", 6};
constexpr Unit kSecond = {"second", 6};

inline char* PrintUnit(char* ptr, const Unit& unit, bool plural)
{
    *ptr++ = ' ';
    std::memcpy(ptr, unit.name, static_cast<size_t>(unit.length));
    ptr += unit.length;
    if (plural)
    {
        *ptr++ = 's';
    }
    return ptr;
}

// Separator in front of item `index` (0-based) of a list of `count` items:
// "a", "a and b", "a, b, and c".
inline char* PrintSeparator(char* ptr, int index, int count)
{
    DACTYL_ASSERT(index > 0 && index < count);

    if (count == 2)
    {
        std::memcpy(ptr, " and ", 5);
        return ptr + 5;
    }

    *ptr++ = ',';
    *ptr++ = ' ';
    if (index == count - 1)
    {
        std::memcpy(ptr, "and ", 4);
        ptr += 4;
    }
    return ptr;
}

} // namespace

void NiceElapsed::Replace(const DurationParts& parts)
{
    parts_ = DurationParts::Normalize(parts);

    char* const first = text_.Begin();

    if (parts_.IsZero())
    {
        text_.Assign("0 seconds");
        return;
    }

    const bool has_seconds = parts_.seconds != 0 || parts_.hundredths != 0;
    const int count = (parts_.days != 0) + (parts_.hours != 0) + (parts_.minutes != 0) + has_seconds;

    char* ptr = first;
    int index = 0;

    if (parts_.days != 0)
    {
        const NiceU32 days(parts_.days);
        std::memcpy(ptr, days.Data(), static_cast<size_t>(days.Size()));
        ptr += days.Size();
        ptr = PrintUnit(ptr, kDay, parts_.days != 1);
        ++index;
    }

    if (parts_.hours != 0)
    {
        if (index > 0)
            ptr = PrintSeparator(ptr, index, count);
        ptr = impl::Utoa_1or2Digits(ptr, parts_.hours);
        ptr = PrintUnit(ptr, kHour, parts_.hours != 1);
        ++index;
    }

    if (parts_.minutes != 0)
    {
        if (index > 0)
            ptr = PrintSeparator(ptr, index, count);
        ptr = impl::Utoa_1or2Digits(ptr, parts_.minutes);
        ptr = PrintUnit(ptr, kMinute, parts_.minutes != 1);
        ++index;
    }

    if (has_seconds)
    {
        if (index > 0)
            ptr = PrintSeparator(ptr, index, count);
        ptr = impl::Utoa_1or2Digits(ptr, parts_.seconds);
        if (parts_.hundredths != 0)
        {
            *ptr++ = '.';
            ptr = impl::Utoa_2Digits(ptr, parts_.hundredths);
        }
        // "1.50 seconds" is plural.
        ptr = PrintUnit(ptr, kSecond, parts_.seconds != 1 || parts_.hundredths != 0);
        ++index;
    }

    DACTYL_ASSERT(index == count);
    DACTYL_ASSERT(ptr - first <= MaxLength);
    text_.AssignPrefix(ptr);
}
