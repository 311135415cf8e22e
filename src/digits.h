// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "config.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace decround {

//==================================================================================================
// DigitStacks
//
// The digits on either side of the decimal point, held as two stacks whose tops meet at the
// point. The integer digits are stored most significant digit first, the fractional digits are
// stored in reverse order (least significant digit first). Moving the decimal point by one digit
// in either direction therefore only pops from and pushes to the back of a string.
//==================================================================================================

struct DigitStacks
{
    std::string integer;
    std::string fractional_reversed;
};

inline bool IsDigit(char ch)
{
    return '0' <= ch && ch <= '9';
}

inline DigitStacks MakeDigitStacks(std::string integer, std::string_view fractional)
{
    return {std::move(integer), std::string(fractional.rbegin(), fractional.rend())};
}

// Returns the fractional digits, most significant digit first.
inline std::string FractionalDigits(DigitStacks const& digits)
{
    return std::string(digits.fractional_reversed.rbegin(), digits.fractional_reversed.rend());
}

// Moves the first fractional digit to the end of the integer digits.
// If there are no fractional digits, appends a '0' instead.
// Multiplies the number by 10.
inline void ShiftLeft(DigitStacks& digits)
{
    char digit = '0';
    if (!digits.fractional_reversed.empty())
    {
        digit = digits.fractional_reversed.back();
        digits.fractional_reversed.pop_back();
    }

    digits.integer.push_back(digit);
}

// Moves the last integer digit to the start of the fractional digits.
// If there are no integer digits, prepends a '0' instead.
// Divides the number by 10.
inline void ShiftRight(DigitStacks& digits)
{
    char digit = '0';
    if (!digits.integer.empty())
    {
        digit = digits.integer.back();
        digits.integer.pop_back();
    }

    digits.fractional_reversed.push_back(digit);
}

// Moves the decimal point 'count' digits to the right (count > 0) or -count digits to the left
// (count < 0), i.e. multiplies the number by 10^count.
inline void Shift(DigitStacks& digits, int64_t count)
{
    if (count > 0)
    {
        digits.integer.reserve(digits.integer.size() + static_cast<size_t>(count));
        for ( ; count != 0; --count)
        {
            ShiftLeft(digits);
        }
    }
    else if (count < 0)
    {
        digits.fractional_reversed.reserve(digits.fractional_reversed.size() + static_cast<size_t>(-count));
        for ( ; count != 0; ++count)
        {
            ShiftRight(digits);
        }
    }
}

// Returns whether the fractional digits are at least one half, i.e. whether rounding to an
// integer rounds away from zero.
//
// PRE: trailing zeros have been removed (or are irrelevant), only the first digit is inspected.
inline bool RoundsUp(DigitStacks const& digits)
{
    if (digits.fractional_reversed.empty())
        return false;

    return digits.fractional_reversed.back() >= '5';
}

// Adds 1 to the unsigned integer represented by 'digits'.
// An empty string represents 0.
inline void IncrementDigits(std::string& digits)
{
    for (auto it = digits.rbegin(); it != digits.rend(); ++it)
    {
        DECROUND_ASSERT(IsDigit(*it));

        if (*it != '9')
        {
            ++*it;
            return;
        }
        *it = '0';
    }

    // All digits were '9' (or there were none).
    digits.insert(digits.begin(), '1');
}

inline void StripLeadingZeros(std::string& digits)
{
    digits.erase(0, digits.find_first_not_of('0'));
}

inline void StripTrailingZeros(std::string& digits)
{
    auto const pos = digits.find_last_not_of('0');
    digits.erase(pos == std::string::npos ? 0 : pos + 1);
}

} // namespace decround
