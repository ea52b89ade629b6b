// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "nice_clock.h"

#include "common.h"
#include "format_digits.h"

using namespace dactyl;

void NiceClock::Replace(const DurationParts& parts, bool with_hundredths)
{
    parts_ = DurationParts::Normalize(parts);
    with_hundredths_ = with_hundredths;

    char* const first = text_.Begin();
    char* ptr = first;

    if (parts_.days != 0)
    {
        if (parts_.days < 10)
        {
            *ptr++ = '0';
            *ptr++ = static_cast<char>('0' + parts_.days);
        }
        else
        {
            ptr = impl::Utoa(ptr, parts_.days);
        }
        *ptr++ = ':';
    }

    ptr = impl::Utoa_2Digits(ptr, parts_.hours);
    *ptr++ = ':';
    ptr = impl::Utoa_2Digits(ptr, parts_.minutes);
    *ptr++ = ':';
    ptr = impl::Utoa_2Digits(ptr, parts_.seconds);

    if (with_hundredths_)
    {
        *ptr++ = '.';
        ptr = impl::Utoa_2Digits(ptr, parts_.hundredths);
    }

    DACTYL_ASSERT(ptr - first <= MaxLength);
    text_.AssignPrefix(ptr);
}
