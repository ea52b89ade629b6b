// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cstdint>
#include <iosfwd>
#include <limits>
#include <string_view>
#include <type_traits>

namespace dactyl {

//==================================================================================================
// ASCII to integer
//==================================================================================================

enum class ParseError {
    none,
    empty,          // no digits
    invalid_digit,  // any byte which is not a digit of the base
    overflow,       // the value does not fit into the result type
};

const char* Name(ParseError error);
std::ostream& operator<<(std::ostream& os, ParseError error);

template <typename Int>
struct ParseResult
{
    Int value;        // 0 on error
    ParseError error;

    explicit operator bool() const noexcept { return error == ParseError::none; }
};

namespace impl {

template <typename UnsignedInt>
inline ParseResult<UnsignedInt> Failed(ParseError error)
{
    return {UnsignedInt{0}, error};
}

// Returns the value of ch in base 10, or a value > 9.
inline uint32_t DecimalDigitValue(char ch)
{
    return static_cast<uint32_t>(static_cast<unsigned char>(ch)) - uint32_t{'0'};
}

// Returns the value of ch in base 16, or a value > 15.
inline uint32_t HexDigitValue(char ch)
{
    const uint32_t c = static_cast<unsigned char>(ch);
    if (c - '0' <= 9)
        return c - '0';
    // Map 'A'-'F' to 'a'-'f'.
    const uint32_t lower = c | 0x20;
    if (lower - 'a' <= 5)
        return lower - 'a' + 10;
    return 16;
}

// Parses [next, last) as a decimal number in [0, max].
//
// All bytes are checked, even after an overflow has been detected, so that
// invalid_digit takes precedence over overflow.
template <typename UnsignedInt>
inline ParseResult<UnsignedInt> ParseDecimal(const char* next, const char* last, UnsignedInt max)
{
    static_assert(std::is_unsigned<UnsignedInt>::value, "unsigned integer type required");

    if (next == last)
        return Failed<UnsignedInt>(ParseError::empty);

    UnsignedInt value = 0;
    bool overflow = false;
    for ( ; next != last; ++next)
    {
        const uint32_t digit = DecimalDigitValue(*next);
        if (digit > 9)
            return Failed<UnsignedInt>(ParseError::invalid_digit);

        if (overflow)
            continue;

        // value * 10 + digit <= max
        if (value > (max - digit) / 10)
        {
            overflow = true;
            continue;
        }
        value = static_cast<UnsignedInt>(value * 10 + digit);
    }

    if (overflow)
        return Failed<UnsignedInt>(ParseError::overflow);

    return {value, ParseError::none};
}

template <typename UnsignedInt>
inline ParseResult<UnsignedInt> ParseHex(const char* next, const char* last)
{
    static_assert(std::is_unsigned<UnsignedInt>::value, "unsigned integer type required");

    constexpr UnsignedInt kMaxBeforeShift = std::numeric_limits<UnsignedInt>::max() >> 4;

    if (next == last)
        return Failed<UnsignedInt>(ParseError::empty);

    UnsignedInt value = 0;
    bool overflow = false;
    for ( ; next != last; ++next)
    {
        const uint32_t digit = HexDigitValue(*next);
        if (digit > 15)
            return Failed<UnsignedInt>(ParseError::invalid_digit);

        if (overflow)
            continue;

        if (value > kMaxBeforeShift)
        {
            overflow = true;
            continue;
        }
        value = static_cast<UnsignedInt>((value << 4) | digit);
    }

    if (overflow)
        return Failed<UnsignedInt>(ParseError::overflow);

    return {value, ParseError::none};
}

// -magnitude for magnitude in [0, 2^(N-1)].
template <typename SignedInt, typename UnsignedInt>
inline SignedInt NegateMagnitude(UnsignedInt magnitude)
{
    if (magnitude == 0)
        return 0;
    return static_cast<SignedInt>(-static_cast<SignedInt>(magnitude - 1) - 1);
}

} // namespace impl

// Parses an unsigned decimal number. Every byte must be a digit; no sign,
// no whitespace. Leading zeros are allowed.
template <typename UnsignedInt>
inline ParseResult<UnsignedInt> BytesToUnsigned(const char* first, const char* last)
{
    static_assert(std::is_unsigned<UnsignedInt>::value && !std::is_same<UnsignedInt, bool>::value,
        "unsigned integer type required");

    return impl::ParseDecimal<UnsignedInt>(first, last, std::numeric_limits<UnsignedInt>::max());
}

template <typename UnsignedInt>
inline ParseResult<UnsignedInt> BytesToUnsigned(std::string_view str)
{
    return BytesToUnsigned<UnsignedInt>(str.data(), str.data() + str.size());
}

// Parses a signed decimal number with an optional leading '+' or '-'.
template <typename SignedInt>
inline ParseResult<SignedInt> BytesToSigned(const char* first, const char* last)
{
    static_assert(std::is_signed<SignedInt>::value && std::is_integral<SignedInt>::value,
        "signed integer type required");

    using UnsignedInt = typename std::make_unsigned<SignedInt>::type;

    bool negative = false;
    if (first != last && (*first == '+' || *first == '-'))
    {
        negative = (*first == '-');
        ++first;
    }

    const UnsignedInt max_magnitude = static_cast<UnsignedInt>(std::numeric_limits<SignedInt>::max());
    const UnsignedInt limit = negative ? static_cast<UnsignedInt>(max_magnitude + 1) : max_magnitude;

    const ParseResult<UnsignedInt> res = impl::ParseDecimal<UnsignedInt>(first, last, limit);
    if (!res)
        return {SignedInt{0}, res.error};

    const SignedInt value = negative ? impl::NegateMagnitude<SignedInt>(res.value) : static_cast<SignedInt>(res.value);
    return {value, ParseError::none};
}

template <typename SignedInt>
inline ParseResult<SignedInt> BytesToSigned(std::string_view str)
{
    return BytesToSigned<SignedInt>(str.data(), str.data() + str.size());
}

// Parses an unsigned hexadecimal number, digits 0-9, a-f and A-F. There is
// no "0x" prefix.
template <typename UnsignedInt>
inline ParseResult<UnsignedInt> HexToUnsigned(const char* first, const char* last)
{
    static_assert(std::is_unsigned<UnsignedInt>::value && !std::is_same<UnsignedInt, bool>::value,
        "unsigned integer type required");

    return impl::ParseHex<UnsignedInt>(first, last);
}

template <typename UnsignedInt>
inline ParseResult<UnsignedInt> HexToUnsigned(std::string_view str)
{
    return HexToUnsigned<UnsignedInt>(str.data(), str.data() + str.size());
}

// Parses the two's complement bit pattern of a signed integer, as printed by
// std::hex. "ff" -> int8_t{-1}, "80" -> int8_t{-128}. No sign is accepted.
template <typename SignedInt>
inline ParseResult<SignedInt> HexToSigned(const char* first, const char* last)
{
    static_assert(std::is_signed<SignedInt>::value && std::is_integral<SignedInt>::value,
        "signed integer type required");

    using UnsignedInt = typename std::make_unsigned<SignedInt>::type;

    const ParseResult<UnsignedInt> res = impl::ParseHex<UnsignedInt>(first, last);
    if (!res)
        return {SignedInt{0}, res.error};

    return {static_cast<SignedInt>(res.value), ParseError::none};
}

template <typename SignedInt>
inline ParseResult<SignedInt> HexToSigned(std::string_view str)
{
    return HexToSigned<SignedInt>(str.data(), str.data() + str.size());
}

} // namespace dactyl
