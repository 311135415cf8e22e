// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "to_float.h"

#include "round.h"

#include <double-conversion/double-conversion.h>

#include <climits>
#include <cstddef>
#include <cmath>
#include <limits>
#include <string>
#include <utility>

namespace {

using double_conversion::StringToDoubleConverter;

StringToDoubleConverter const& Converter()
{
    static StringToDoubleConverter const conv(
        StringToDoubleConverter::NO_FLAGS,
        0.0,
        std::numeric_limits<double>::quiet_NaN(),
        nullptr,
        nullptr);

    return conv;
}

float StringToFloatingPoint(std::string const& str, int& processed_characters_count, float /*tag*/)
{
    return Converter().StringToFloat(str.data(), static_cast<int>(str.size()), &processed_characters_count);
}

double StringToFloatingPoint(std::string const& str, int& processed_characters_count, double /*tag*/)
{
    return Converter().StringToDouble(str.data(), static_cast<int>(str.size()), &processed_characters_count);
}

template <typename Float>
decround::ConversionResult<Float> ConvertTo(decround::Decomposition const& decomposition)
{
    using decround::ConversionStatus;

    auto const joined = decround::Reassemble(decomposition);
    if (!joined.ok)
        return {Float{0}, ConversionStatus::invalid};

    if (joined.text.size() > static_cast<size_t>(INT_MAX))
        return {Float{0}, ConversionStatus::input_too_large};

    int processed_characters_count = 0;
    Float const value = StringToFloatingPoint(joined.text, processed_characters_count, Float{0});

    if (processed_characters_count != static_cast<int>(joined.text.size()))
        return {Float{0}, ConversionStatus::syntax_error};

    if (std::isinf(value))
        return {Float{0}, ConversionStatus::out_of_range};

    return {value, ConversionStatus::ok};
}

decround::Decomposition EnsureExponentRange(decround::Decomposition decomposition, int min_exponent, int max_exponent)
{
    if (!decomposition.valid)
        return {};

    if (decomposition.exponent < min_exponent || decomposition.exponent > max_exponent)
        return {};

    return decomposition;
}

} // namespace

char const* decround::ToString(ConversionStatus status)
{
    switch (status)
    {
    case ConversionStatus::ok:
        return "ok";
    case ConversionStatus::invalid:
        return "failed to parse number";
    case ConversionStatus::syntax_error:
        return "syntax error";
    case ConversionStatus::out_of_range:
        return "value out of range";
    case ConversionStatus::input_too_large:
        return "input too large";
    }

    return "unknown error";
}

decround::ConversionResult<float> decround::ToFloat(Decomposition const& decomposition)
{
    return ConvertTo<float>(decomposition);
}

decround::ConversionResult<double> decround::ToDouble(Decomposition const& decomposition)
{
    return ConvertTo<double>(decomposition);
}

decround::Decomposition decround::EnsureExponentSingle(Decomposition decomposition)
{
    return EnsureExponentRange(std::move(decomposition), -126, 127);
}

decround::Decomposition decround::EnsureExponentDouble(Decomposition decomposition)
{
    return EnsureExponentRange(std::move(decomposition), -1022, 1023);
}
