// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "decomposition.h"

namespace decround {

enum class ConversionStatus {
    ok,
    invalid,            // The decomposition is invalid.
    syntax_error,       // The converter did not accept the whole reassembled text.
    out_of_range,       // The number is too large for the target type.
    input_too_large,    // The reassembled text is too long for the converter.
};

template <typename Float>
struct ConversionResult
{
    Float value;
    ConversionStatus status;
};

char const* ToString(ConversionStatus status);

// Converts the given decomposition into the nearest single-precision number.
// On failure the value is 0. Numbers too small to be represented are converted to 0 and are not
// an error.
ConversionResult<float> ToFloat(Decomposition const& decomposition);

// Converts the given decomposition into the nearest double-precision number.
ConversionResult<double> ToDouble(Decomposition const& decomposition);

// Returns the decomposition unchanged if its exponent is within the exponent range of IEEE
// single-precision numbers, [-126, 127], and an invalid decomposition otherwise.
Decomposition EnsureExponentSingle(Decomposition decomposition);

// Returns the decomposition unchanged if its exponent is within the exponent range of IEEE
// double-precision numbers, [-1022, 1023], and an invalid decomposition otherwise.
Decomposition EnsureExponentDouble(Decomposition decomposition);

} // namespace decround
