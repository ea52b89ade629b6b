// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "fixed_text.h"
#include "format_digits.h"

#include <cstdint>
#include <limits>
#include <string_view>
#include <type_traits>

namespace dactyl {

// An unsigned integer printed with a ',' between each group of three digits,
// e.g. 1234567 -> "1,234,567".
template <typename UnsignedInt>
class NiceInt
{
    static_assert(std::is_unsigned<UnsignedInt>::value && !std::is_same<UnsignedInt, bool>::value,
        "unsigned integer type required");

public:
    using value_type = UnsignedInt;

    static constexpr int MaxLength = impl::MaxGroupedLength<UnsignedInt>();

private:
    FixedText<MaxLength> text_;

    // Keeps '0's in front of a NiceU8 for the padded views.
    void PadFront(std::true_type) noexcept { text_.FillFront('0'); }
    void PadFront(std::false_type) noexcept {}

public:
    NiceInt() : NiceInt(UnsignedInt{0}) {}
    explicit NiceInt(UnsignedInt value) { Replace(value); }

    static NiceInt Min() { return NiceInt(std::numeric_limits<UnsignedInt>::min()); }
    static NiceInt Max() { return NiceInt(std::numeric_limits<UnsignedInt>::max()); }

    // Re-renders in place. The capacity is unchanged.
    void Replace(UnsignedInt value)
    {
        text_.AssignSuffix(impl::PrintGrouped(text_.End(), value));
        PadFront(std::is_same<UnsignedInt, uint8_t>{});
    }

    std::string_view Str() const noexcept { return text_.Str(); }
    const char* Data() const noexcept { return text_.Data(); }
    const unsigned char* Bytes() const noexcept { return text_.Bytes(); }
    int Size() const noexcept { return text_.Size(); }
    static constexpr int Capacity() noexcept { return MaxLength; }

    // NiceU8 only: zero-padded to at least two digits ("03", "50", "113").
    template <typename U = UnsignedInt, typename std::enable_if<std::is_same<U, uint8_t>::value, int>::type = 0>
    std::string_view Str2() const { return text_.Tail(Size() < 2 ? 2 : Size()); }

    // NiceU8 only: zero-padded to three digits ("003", "050", "113").
    template <typename U = UnsignedInt, typename std::enable_if<std::is_same<U, uint8_t>::value, int>::type = 0>
    std::string_view Str3() const { return text_.Tail(3); }

    template <typename U = UnsignedInt, typename std::enable_if<std::is_same<U, uint8_t>::value, int>::type = 0>
    const unsigned char* Bytes2() const { return reinterpret_cast<const unsigned char*>(Str2().data()); }

    template <typename U = UnsignedInt, typename std::enable_if<std::is_same<U, uint8_t>::value, int>::type = 0>
    const unsigned char* Bytes3() const { return reinterpret_cast<const unsigned char*>(Str3().data()); }

    friend bool operator==(const NiceInt& lhs, const NiceInt& rhs) noexcept { return lhs.text_ == rhs.text_; }
    friend bool operator!=(const NiceInt& lhs, const NiceInt& rhs) noexcept { return lhs.text_ != rhs.text_; }
    friend bool operator<(const NiceInt& lhs, const NiceInt& rhs) noexcept { return lhs.text_ < rhs.text_; }
};

using NiceU8  = NiceInt<uint8_t>;
using NiceU16 = NiceInt<uint16_t>;
using NiceU32 = NiceInt<uint32_t>;
using NiceU64 = NiceInt<uint64_t>;

extern template class NiceInt<uint8_t>;
extern template class NiceInt<uint16_t>;
extern template class NiceInt<uint32_t>;
extern template class NiceInt<uint64_t>;

} // namespace dactyl
