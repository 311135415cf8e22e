// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <charconv>
#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>

namespace decround {

// Formats the given double-precision number with 17 significant digits, which is enough to read
// the number back in exactly. The output format is similar to printf("%.17g") but does not
// depend on the current locale.
// NaN and +/-Infinity are formatted as "NaN", "Infinity" and "-Infinity", resp.
std::string Stringify(double value);

// Formats the given single-precision number with 9 significant digits.
std::string Stringify(float value);

// Formats the given extended-precision number like a double-precision number, i.e. the value is
// first rounded to double precision.
std::string Stringify(long double value);

std::string Stringify(bool value);

std::string Stringify(std::nullptr_t);

std::string Stringify(std::string_view text);

std::string Stringify(char const* text);

template <typename Int, typename std::enable_if<std::is_integral<Int>::value && !std::is_same<Int, bool>::value, int>::type = 0>
std::string Stringify(Int value)
{
    char buf[32];
    auto const res = std::to_chars(buf, buf + sizeof(buf), value);
    return std::string(buf, res.ptr);
}

} // namespace decround
