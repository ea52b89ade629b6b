// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "nice_float.h"

#include "common.h"
#include "decimal.h"
#include "ieee.h"

#include <limits>

using namespace dactyl;

static_assert(kFloatPrecision <= impl::kMaxFixedPrecision, "");

static int ClampPrecision(int precision)
{
    if (precision < 0)
        return 0;
    if (precision > kFloatPrecision)
        return kFloatPrecision;
    return precision;
}

NiceFloat::NiceFloat(double value, int precision)
    : precision_(ClampPrecision(precision))
{
    Render(value);
}

NiceFloat::NiceFloat(float value, int precision)
    : precision_(ClampPrecision(precision))
{
    Render(value);
}

void NiceFloat::Replace(double value)
{
    Render(value);
}

void NiceFloat::Replace(float value)
{
    Render(value);
}

std::string_view NiceFloat::Compact() const noexcept
{
    std::string_view str = text_.Str();
    if ((kind_ != FloatKind::normal && kind_ != FloatKind::zero) || precision_ == 0)
        return str;

    // The text ends with '.' followed by precision_ digits.
    size_t len = str.size();
    while (str[len - 1] == '0')
    {
        --len;
    }
    if (str[len - 1] == '.')
    {
        --len;
    }

    return str.substr(0, len);
}

template <typename Float>
void NiceFloat::Render(Float value)
{
    const IEEE<Float> ieee(value);

    if (ieee.IsNaN())
    {
        kind_ = FloatKind::nan;
        text_.Assign("NaN");
        return;
    }

    const bool negative = ieee.SignBit();

    if (ieee.IsInf())
    {
        kind_ = FloatKind::infinite;
        text_.Assign(negative ? "-Infinity" : "Infinity");
        return;
    }

    const Float abs = ieee.AbsValue();
    if (abs >= static_cast<Float>(18446744073709551616.0))
    {
        kind_ = FloatKind::overflow;
        PrintOverflow(negative);
        return;
    }

    const impl::FixedDecimal dec = impl::RoundToFixed(abs, precision_);
    if (dec.integer == 0 && dec.fraction == 0)
    {
        kind_ = FloatKind::zero;
        PrintFixed(false, 0, 0);
        return;
    }

    kind_ = FloatKind::normal;
    PrintFixed(negative, dec.integer, dec.fraction);
}

void NiceFloat::PrintFixed(bool negative, uint64_t integer, uint32_t fraction)
{
    char* ptr = text_.End();

    if (precision_ > 0)
    {
        ptr = impl::PrintZeroPadded(ptr, fraction, precision_);
        *--ptr = '.';
    }

    ptr = impl::PrintGrouped(ptr, integer);
    if (negative)
    {
        *--ptr = '-';
    }

    text_.AssignSuffix(ptr);
}

void NiceFloat::PrintOverflow(bool negative)
{
    char* ptr = impl::PrintGrouped(text_.End(), std::numeric_limits<uint64_t>::max());
    if (negative)
    {
        *--ptr = '-';
    }
    *--ptr = ' ';
    *--ptr = negative ? '<' : '>';

    text_.AssignSuffix(ptr);
}
