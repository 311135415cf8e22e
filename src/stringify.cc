// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "stringify.h"

#include "config.h"

#include <double-conversion/double-conversion.h>

namespace {

constexpr int kBufferSize = 128;

std::string FormatPrecision(double value, int precision)
{
    using namespace double_conversion;

    char buf[kBufferSize];

    auto const& conv = DoubleToStringConverter::EcmaScriptConverter();
    StringBuilder builder(buf, kBufferSize);
    if (!conv.ToPrecision(value, precision, &builder))
        return {};

    return std::string(buf, buf + builder.position());
}

} // namespace

std::string decround::Stringify(double value)
{
    return FormatPrecision(value, DECROUND_DOUBLE_PRECISION);
}

std::string decround::Stringify(float value)
{
    return FormatPrecision(static_cast<double>(value), DECROUND_SINGLE_PRECISION);
}

std::string decround::Stringify(long double value)
{
    return FormatPrecision(static_cast<double>(value), DECROUND_DOUBLE_PRECISION);
}

std::string decround::Stringify(bool value)
{
    return value ? "true" : "false";
}

std::string decround::Stringify(std::nullptr_t)
{
    return "null";
}

std::string decround::Stringify(std::string_view text)
{
    return std::string(text);
}

std::string decround::Stringify(char const* text)
{
    if (text == nullptr)
        return Stringify(nullptr);

    return std::string(text);
}
