// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "decomposition.h"
#include "stringify.h"

#include <string_view>

namespace decround {

// Decomposes the number in 'text' into sign, integer digits, fractional digits and exponent.
//
// All whitespace and all commas are removed before parsing, so inputs like "  2,000,000 " are
// accepted. The remaining text must have the form
//
//      [+|-]DIGITS[.DIGITS][(x10^ | *10^ | e)[+|-]DIGITS]
//
// where the exponent markers are case-insensitive. The integer digits are mandatory (".5" is
// rejected).
//
// Returns an invalid decomposition if the text does not match or if the exponent does not fit
// into an int.
Decomposition DecomposeString(std::string_view text);

// Decomposes Stringify(value).
template <typename T>
Decomposition Decompose(T const& value)
{
    return DecomposeString(Stringify(value));
}

} // namespace decround
