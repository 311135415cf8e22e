// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <string>

namespace decround {

// A decimal number in the form
//
//      (-1)^negative * INTEGER.FRACTIONAL * 10^exponent
//
// where 'integer' holds the digits before the decimal point (most significant digit first, no
// leading zeros) and 'fractional' holds the digits after the decimal point (no trailing zeros).
// An empty digit string represents 0. Zero is never negative.
//
// If 'valid' is false, the number could not be parsed and all other members are zero-valued.
struct Decomposition
{
    bool        negative = false;
    std::string integer;
    std::string fractional;
    int         exponent = 0;
    bool        valid    = false;
};

inline bool operator==(Decomposition const& lhs, Decomposition const& rhs)
{
    return lhs.negative == rhs.negative
        && lhs.integer == rhs.integer
        && lhs.fractional == rhs.fractional
        && lhs.exponent == rhs.exponent
        && lhs.valid == rhs.valid;
}

inline bool operator!=(Decomposition const& lhs, Decomposition const& rhs)
{
    return !(lhs == rhs);
}

} // namespace decround
