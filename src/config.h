// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cassert>

#ifndef DECROUND_ASSERT
#define DECROUND_ASSERT(X) assert(X)
#endif

// Number of significant digits used to format a double-precision number.
// 17 digits are enough to read the number back in exactly.
#ifndef DECROUND_DOUBLE_PRECISION
#define DECROUND_DOUBLE_PRECISION 17
#endif

// Number of significant digits used to format a single-precision number.
// 9 digits are enough to read the number back in exactly.
#ifndef DECROUND_SINGLE_PRECISION
#define DECROUND_SINGLE_PRECISION 9
#endif
