// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "nice_int.h"

namespace dactyl {

static_assert(NiceU8::MaxLength == 3, "255");
static_assert(NiceU16::MaxLength == 6, "65,535");
static_assert(NiceU32::MaxLength == 13, "4,294,967,295");
static_assert(NiceU64::MaxLength == 26, "18,446,744,073,709,551,615");

template class NiceInt<uint8_t>;
template class NiceInt<uint16_t>;
template class NiceInt<uint32_t>;
template class NiceInt<uint64_t>;

} // namespace dactyl
