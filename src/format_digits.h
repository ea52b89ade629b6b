// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "common.h"

#include <cstdint>
#include <cstring>
#include <limits>
#include <type_traits>

namespace dactyl {
namespace impl {

inline char* Utoa_2Digits(char* buf, uint32_t digits)
{
    static constexpr char Digits100[200] = {
        '0','0','0','1','0','2','0','3','0','4','0','5','0','6','0','7','0','8','0','9',
        '1','0','1','1','1','2','1','3','1','4','1','5','1','6','1','7','1','8','1','9',
        '2','0','2','1','2','2','2','3','2','4','2','5','2','6','2','7','2','8','2','9',
        '3','0','3','1','3','2','3','3','3','4','3','5','3','6','3','7','3','8','3','9',
        '4','0','4','1','4','2','4','3','4','4','4','5','4','6','4','7','4','8','4','9',
        '5','0','5','1','5','2','5','3','5','4','5','5','5','6','5','7','5','8','5','9',
        '6','0','6','1','6','2','6','3','6','4','6','5','6','6','6','7','6','8','6','9',
        '7','0','7','1','7','2','7','3','7','4','7','5','7','6','7','7','7','8','7','9',
        '8','0','8','1','8','2','8','3','8','4','8','5','8','6','8','7','8','8','8','9',
        '9','0','9','1','9','2','9','3','9','4','9','5','9','6','9','7','9','8','9','9',
    };

    DACTYL_ASSERT(digits <= 99);
    std::memcpy(buf, &Digits100[2*digits], 2*sizeof(char));
    return buf + 2;
}

inline char* Utoa_3Digits(char* buf, uint32_t digits)
{
    DACTYL_ASSERT(digits <= 999);
    buf[0] = static_cast<char>('0' + digits / 100);
    Utoa_2Digits(buf + 1, digits % 100);
    return buf + 3;
}

// Writes one or two digits, without padding.
inline char* Utoa_1or2Digits(char* buf, uint32_t digits)
{
    DACTYL_ASSERT(digits <= 99);
    if (digits < 10)
    {
        buf[0] = static_cast<char>('0' + digits);
        return buf + 1;
    }
    return Utoa_2Digits(buf, digits);
}

inline int DecimalLength(uint32_t v)
{
    if (v >= 1000000000) { return 10; }
    if (v >= 100000000) { return 9; }
    if (v >= 10000000) { return 8; }
    if (v >= 1000000) { return 7; }
    if (v >= 100000) { return 6; }
    if (v >= 10000) { return 5; }
    if (v >= 1000) { return 4; }
    if (v >= 100) { return 3; }
    if (v >= 10) { return 2; }
    return 1;
}

// Writes the decimal digits of v into [buf, buf + DecimalLength(v)).
inline char* Utoa(char* buf, uint32_t v)
{
    char* const last = buf + DecimalLength(v);

    char* ptr = last;
    while (v >= 100)
    {
        ptr -= 2;
        Utoa_2Digits(ptr, v % 100);
        v /= 100;
    }
    if (v >= 10)
    {
        ptr -= 2;
        Utoa_2Digits(ptr, v);
    }
    else
    {
        *--ptr = static_cast<char>('0' + v);
    }

    DACTYL_ASSERT(ptr == buf);
    return last;
}

// Writes exactly `num_digits` digits of v, zero-padded on the left, ending
// at `last`. Returns a pointer to the first digit.
inline char* PrintZeroPadded(char* last, uint32_t v, int num_digits)
{
    DACTYL_ASSERT(num_digits >= 0);

    char* ptr = last;
    for (int i = 0; i < num_digits; ++i)
    {
        *--ptr = static_cast<char>('0' + v % 10);
        v /= 10;
    }

    DACTYL_ASSERT(v == 0);
    return ptr;
}

//==================================================================================================
// Digit grouping
//==================================================================================================

// Number of bytes needed for the largest value of UnsignedInt with a comma
// between each group of three digits.
template <typename UnsignedInt>
constexpr int MaxGroupedLength()
{
    static_assert(std::is_unsigned<UnsignedInt>::value, "unsigned integer type required");

    constexpr int digits = std::numeric_limits<UnsignedInt>::digits10 + 1;
    return digits + (digits - 1) / 3;
}

// Writes the digits of value, with a ',' every three digits counting from
// the right, ending at `last`. Returns a pointer to the first character.
//
// PRE: At least MaxGroupedLength<UnsignedInt>() bytes are available in front
// of `last`.
template <typename UnsignedInt>
inline char* PrintGrouped(char* last, UnsignedInt value)
{
    static_assert(std::is_unsigned<UnsignedInt>::value, "unsigned integer type required");

    // Promote small types, so that the arithmetic below doesn't go through int.
    using Work = typename std::conditional<(sizeof(UnsignedInt) <= sizeof(uint32_t)), uint32_t, uint64_t>::type;

    Work v = value;
    char* ptr = last;
    while (v >= 1000)
    {
        const Work q = v / 1000;
        const uint32_t r = static_cast<uint32_t>(v - q * 1000);
        v = q;
        ptr -= 3;
        Utoa_3Digits(ptr, r);
        *--ptr = ',';
    }

    const uint32_t top = static_cast<uint32_t>(v);
    if (top >= 100)
    {
        ptr -= 3;
        Utoa_3Digits(ptr, top);
    }
    else if (top >= 10)
    {
        ptr -= 2;
        Utoa_2Digits(ptr, top);
    }
    else
    {
        *--ptr = static_cast<char>('0' + top);
    }

    DACTYL_ASSERT(last - ptr <= MaxGroupedLength<UnsignedInt>());
    return ptr;
}

} // namespace impl
} // namespace dactyl
