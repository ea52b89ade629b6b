// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cassert>

// Internal invariants only (buffer capacities, digit ranges).
// Define before including any dactyl header to replace the default.
#ifndef DACTYL_ASSERT
#define DACTYL_ASSERT(X) assert(X)
#endif
