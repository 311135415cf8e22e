// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "decompose.h"
#include "decomposition.h"
#include "stringify.h"

#include <string>
#include <string_view>

namespace decround {

struct ReassembleResult
{
    std::string text;
    bool ok;
};

// Rounds the given number half-up (away from zero) to 'places' digits after the decimal point.
// A negative number of places rounds to a multiple of 10^-places, e.g. RoundTo(d, -3) rounds to
// the nearest multiple of 1000.
//
// The result has no fractional digits and an exponent of -places. A result of zero is never
// negative.
// Returns an invalid decomposition if the input is invalid.
//
// Note:
// The work done (and the memory used) is proportional to |places + exponent|.
Decomposition RoundTo(Decomposition decomposition, int places);

// Converts the given number into the form [-]INTEGER[.FRACTIONAL], without redundant leading or
// trailing zeros. The integer part has at least one digit and zero has no sign.
// Returns {"", false} if the input is invalid.
ReassembleResult Reassemble(Decomposition const& decomposition);

// Reassemble(RoundTo(DecomposeString(text), places))
ReassembleResult RoundDecimalString(std::string_view text, int places);

// RoundDecimalString(Stringify(value), places)
template <typename T>
ReassembleResult RoundDecimal(T const& value, int places)
{
    return RoundDecimalString(Stringify(value), places);
}

} // namespace decround
