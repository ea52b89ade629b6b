// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "fixed_text.h"
#include "format_digits.h"

#include <cstdint>
#include <string_view>

namespace dactyl {

// Default (and maximum) number of fractional digits.
constexpr int kFloatPrecision = 8;

enum class FloatKind {
    zero,
    normal,
    infinite,
    nan,
    overflow, // |value| >= 2^64
};

// A float or double printed with a grouped integer part and a fixed number of
// fractional digits, e.g. -1234.5 -> "-1,234.50000000".
//
// The fraction is rounded half away from zero, based on the shortest decimal
// representation of the value. Values which round to zero are printed
// without a sign.
class NiceFloat
{
public:
    // Sign, integer part, point and fraction.
    static constexpr int MaxLength = 1 + impl::MaxGroupedLength<uint64_t>() + 1 + kFloatPrecision;

private:
    FixedText<MaxLength> text_;
    FloatKind kind_ = FloatKind::zero;
    int precision_ = kFloatPrecision;

public:
    NiceFloat() : NiceFloat(0.0) {}

    // Precision is clamped to [0, kFloatPrecision].
    explicit NiceFloat(double value, int precision = kFloatPrecision);
    explicit NiceFloat(float value, int precision = kFloatPrecision);

    // Re-renders in place, keeping the precision.
    void Replace(double value);
    void Replace(float value);

    FloatKind Kind() const noexcept { return kind_; }
    int Precision() const noexcept { return precision_; }

    // All fractional digits, e.g. "1.50000000".
    std::string_view Str() const noexcept { return text_.Str(); }
    std::string_view Precise() const noexcept { return text_.Str(); }

    // Without trailing zeros in the fraction, e.g. "1.5" or "2".
    std::string_view Compact() const noexcept;

    const char* Data() const noexcept { return text_.Data(); }
    const unsigned char* Bytes() const noexcept { return text_.Bytes(); }
    int Size() const noexcept { return text_.Size(); }

    friend bool operator==(const NiceFloat& lhs, const NiceFloat& rhs) noexcept { return lhs.text_ == rhs.text_; }
    friend bool operator!=(const NiceFloat& lhs, const NiceFloat& rhs) noexcept { return lhs.text_ != rhs.text_; }
    friend bool operator<(const NiceFloat& lhs, const NiceFloat& rhs) noexcept { return lhs.text_ < rhs.text_; }

private:
    template <typename Float>
    void Render(Float value);

    void PrintFixed(bool negative, uint64_t integer, uint32_t fraction);
    void PrintOverflow(bool negative);
};

} // namespace dactyl
