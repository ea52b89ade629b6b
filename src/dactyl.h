// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "duration_parts.h"
#include "nice_clock.h"
#include "nice_elapsed.h"
#include "nice_float.h"
#include "nice_format.h"
#include "nice_int.h"
#include "nice_percent.h"
#include "parse.h"
#include "ratio.h"
#include "saturating.h"
