// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

// Exact, string-based decimal parsing, normalization and rounding.
//
//      Stringify -> DecomposeString -> RoundTo -> Reassemble -> (ToFloat | ToDouble)

#include "decompose.h"
#include "decomposition.h"
#include "round.h"
#include "stringify.h"
#include "to_float.h"
