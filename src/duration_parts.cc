// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "duration_parts.h"

#include "common.h"

using namespace dactyl;

DurationParts DurationParts::FromSeconds(uint32_t total_seconds, uint32_t hundredths)
{
    DACTYL_ASSERT(hundredths <= 99);

    DurationParts parts;
    parts.days       = total_seconds / 86400;
    parts.hours      = static_cast<uint8_t>(total_seconds % 86400 / 3600);
    parts.minutes    = static_cast<uint8_t>(total_seconds % 3600 / 60);
    parts.seconds    = static_cast<uint8_t>(total_seconds % 60);
    parts.hundredths = static_cast<uint8_t>(hundredths <= 99 ? hundredths : 99);

    // Saturated.
    if (total_seconds == kMaxDurationSeconds)
        parts.hundredths = 0;

    return parts;
}

uint64_t DurationParts::TotalSeconds() const
{
    return uint64_t{days} * 86400 + uint64_t{hours} * 3600 + uint64_t{minutes} * 60 + seconds;
}

DurationParts DurationParts::Normalize(const DurationParts& parts)
{
    const uint64_t total = parts.TotalSeconds() + parts.hundredths / 100;
    if (total > kMaxDurationSeconds)
        return Max();

    return FromSeconds(static_cast<uint32_t>(total), parts.hundredths % 100u);
}
