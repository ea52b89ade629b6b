// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "fixed_text.h"
#include "ratio.h"

#include <cstdint>
#include <string_view>

namespace dactyl {

// Largest fraction which can be printed: 100,000,000.00%.
constexpr double kPercentMaxFraction = 1000000.0;

// A fraction of 1.0 printed as a percentage with two decimal places,
// e.g. 0.12345 -> "12.35%".
//
// NaN and -Infinity print as 0.00%, +Infinity prints as the maximum. Other
// values are clamped into [0, kPercentMaxFraction].
class NicePercent
{
public:
    static constexpr int MaxLength = 15; // "100,000,000.00%"

private:
    FixedText<MaxLength> text_;

public:
    NicePercent() : NicePercent(0.0) {}
    explicit NicePercent(double fraction) { Replace(fraction); }
    explicit NicePercent(float fraction) { Replace(fraction); }

    static NicePercent Min() { return NicePercent(0.0); }
    static NicePercent Max() { return NicePercent(kPercentMaxFraction); }

    void Replace(double fraction);
    void Replace(float fraction);

    std::string_view Str() const noexcept { return text_.Str(); }
    const char* Data() const noexcept { return text_.Data(); }
    const unsigned char* Bytes() const noexcept { return text_.Bytes(); }
    int Size() const noexcept { return text_.Size(); }

    friend bool operator==(const NicePercent& lhs, const NicePercent& rhs) noexcept { return lhs.text_ == rhs.text_; }
    friend bool operator!=(const NicePercent& lhs, const NicePercent& rhs) noexcept { return lhs.text_ != rhs.text_; }
    friend bool operator<(const NicePercent& lhs, const NicePercent& rhs) noexcept { return lhs.text_ < rhs.text_; }

private:
    // 1 == 0.01%.
    void PrintHundredths(uint64_t hundredths);
};

struct PercentResult
{
    NicePercent percent;
    RatioStatus status;

    // Lossy ratios still produce a percentage.
    explicit operator bool() const noexcept {
        return status == RatioStatus::ok || status == RatioStatus::lossy;
    }
};

// The percentage e/d, e.g. PercentFromRatio(1, 3) -> "33.33%".
// Fails (with percent == 0.00%) if d is zero or e/d is not finite.
template <typename T>
inline PercentResult PercentFromRatio(T e, T d)
{
    const RatioResult ratio = Ratio(e, d);
    if (ratio.status == RatioStatus::zero_denominator || ratio.status == RatioStatus::not_finite)
        return {NicePercent::Min(), ratio.status};

    return {NicePercent(ratio.value), ratio.status};
}

} // namespace dactyl
