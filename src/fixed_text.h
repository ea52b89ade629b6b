// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "common.h"

#include <cstdint>
#include <cstring>
#include <string_view>

namespace dactyl {

// A fixed-size ASCII buffer with an occupied range [from, from + len).
//
// Numbers are printed back to front, so they occupy a suffix of the buffer.
// Text is printed front to back and occupies a prefix. Either way the
// capacity never changes and nothing is allocated.
template <int Capacity>
class FixedText
{
    static_assert(Capacity > 0 && Capacity <= 255, "invalid capacity");

    char buf_[Capacity] = {};
    uint8_t from_ = Capacity;
    uint8_t len_ = 0;

public:
    char* Begin() noexcept { return buf_; }
    char* End() noexcept { return buf_ + Capacity; }

    // Marks [first, End()) as occupied.
    void AssignSuffix(const char* first)
    {
        DACTYL_ASSERT(first >= buf_);
        DACTYL_ASSERT(first <= buf_ + Capacity);

        from_ = static_cast<uint8_t>(first - buf_);
        len_ = static_cast<uint8_t>(Capacity - from_);
    }

    // Marks [Begin(), last) as occupied.
    void AssignPrefix(const char* last)
    {
        DACTYL_ASSERT(last >= buf_);
        DACTYL_ASSERT(last <= buf_ + Capacity);

        from_ = 0;
        len_ = static_cast<uint8_t>(last - buf_);
    }

    // Copies str to the front of the buffer.
    void Assign(std::string_view str)
    {
        DACTYL_ASSERT(str.size() <= static_cast<size_t>(Capacity));

        std::memcpy(buf_, str.data(), str.size());
        AssignPrefix(buf_ + str.size());
    }

    // Fills the unoccupied bytes in front of a suffix with ch.
    void FillFront(char ch) noexcept { std::memset(buf_, ch, from_); }

    // The last n bytes of the buffer, occupied or not.
    std::string_view Tail(int n) const
    {
        DACTYL_ASSERT(n >= 0);
        DACTYL_ASSERT(n <= Capacity);

        return std::string_view(buf_ + (Capacity - n), static_cast<size_t>(n));
    }

    std::string_view Str() const noexcept { return std::string_view(buf_ + from_, len_); }
    const char* Data() const noexcept { return buf_ + from_; }
    const unsigned char* Bytes() const noexcept { return reinterpret_cast<const unsigned char*>(buf_ + from_); }
    int Size() const noexcept { return len_; }

    friend bool operator==(const FixedText& lhs, const FixedText& rhs) noexcept { return lhs.Str() == rhs.Str(); }
    friend bool operator!=(const FixedText& lhs, const FixedText& rhs) noexcept { return lhs.Str() != rhs.Str(); }
    friend bool operator<(const FixedText& lhs, const FixedText& rhs) noexcept { return lhs.Str() < rhs.Str(); }
};

} // namespace dactyl
