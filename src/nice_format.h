// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "nice_clock.h"
#include "nice_elapsed.h"
#include "nice_float.h"
#include "nice_int.h"
#include "nice_percent.h"
#include "parse.h"
#include "ratio.h"

#include <fmt/format.h>

#include <ostream>
#include <type_traits>

//==================================================================================================
// Output of the Nice* types through fmt and std::ostream.
//
// The rendered text is padded as a whole; fill, width and alignment work as
// for strings:
//
//  fmt::format("{:>8}", NiceU16(1234))   == "   1,234"
//  os << std::setw(8) << NiceU16(1234)   -> "   1,234"
//
// For NiceFloat this prints the precise text. Use Compact() for the short form.
//==================================================================================================

namespace dactyl {

namespace impl {

template <typename T> struct IsNiceText : std::false_type {};
template <typename U> struct IsNiceText<NiceInt<U>> : std::true_type {};
template <> struct IsNiceText<NiceFloat> : std::true_type {};
template <> struct IsNiceText<NicePercent> : std::true_type {};
template <> struct IsNiceText<NiceElapsed> : std::true_type {};
template <> struct IsNiceText<NiceClock> : std::true_type {};

template <typename Nice>
struct NiceFormatter : fmt::formatter<fmt::string_view>
{
    template <typename FormatContext>
    auto format(const Nice& value, FormatContext& ctx) const -> decltype(ctx.out())
    {
        const fmt::string_view str(value.Data(), static_cast<size_t>(value.Size()));
        return fmt::formatter<fmt::string_view>::format(str, ctx);
    }
};

} // namespace impl

template <typename Nice, typename std::enable_if<impl::IsNiceText<Nice>::value, int>::type = 0>
inline std::ostream& operator<<(std::ostream& os, const Nice& value)
{
    return os << value.Str();
}

} // namespace dactyl

namespace fmt {

template <typename UnsignedInt>
struct formatter<dactyl::NiceInt<UnsignedInt>> : dactyl::impl::NiceFormatter<dactyl::NiceInt<UnsignedInt>> {};

template <>
struct formatter<dactyl::NiceFloat> : dactyl::impl::NiceFormatter<dactyl::NiceFloat> {};

template <>
struct formatter<dactyl::NicePercent> : dactyl::impl::NiceFormatter<dactyl::NicePercent> {};

template <>
struct formatter<dactyl::NiceElapsed> : dactyl::impl::NiceFormatter<dactyl::NiceElapsed> {};

template <>
struct formatter<dactyl::NiceClock> : dactyl::impl::NiceFormatter<dactyl::NiceClock> {};

template <>
struct formatter<dactyl::ParseError> : formatter<string_view>
{
    template <typename FormatContext>
    auto format(dactyl::ParseError error, FormatContext& ctx) const -> decltype(ctx.out())
    {
        return formatter<string_view>::format(dactyl::Name(error), ctx);
    }
};

template <>
struct formatter<dactyl::RatioStatus> : formatter<string_view>
{
    template <typename FormatContext>
    auto format(dactyl::RatioStatus status, FormatContext& ctx) const -> decltype(ctx.out())
    {
        return formatter<string_view>::format(dactyl::Name(status), ctx);
    }
};

} // namespace fmt
