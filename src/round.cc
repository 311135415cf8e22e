// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "round.h"

#include "digits.h"

#include <cstdint>
#include <limits>
#include <utility>

decround::Decomposition decround::RoundTo(Decomposition decomposition, int places)
{
    if (!decomposition.valid)
        return {};

    // The resulting exponent is -places.
    if (places == std::numeric_limits<int>::min())
        return {};

    // 'places' refers to the normalized number, but the digits are still scaled by 10^exponent.
    // E.g. for 12.1456 x 10^1 = 121.456 and places = 2, three fractional digits are moved into the
    // integer part.
    int64_t const count = int64_t{places} + decomposition.exponent;

    DigitStacks digits = MakeDigitStacks(std::move(decomposition.integer), decomposition.fractional);
    Shift(digits, count);

    if (RoundsUp(digits))
    {
        IncrementDigits(digits.integer);
    }

    Decomposition result;

    result.integer = std::move(digits.integer);
    StripLeadingZeros(result.integer);

    result.negative = decomposition.negative && !result.integer.empty();
    result.exponent = -places;
    result.valid = true;

    return result;
}

decround::ReassembleResult decround::Reassemble(Decomposition const& decomposition)
{
    if (!decomposition.valid)
        return {"", false};

    DigitStacks digits = MakeDigitStacks(decomposition.integer, decomposition.fractional);
    Shift(digits, decomposition.exponent);

    std::string& integer = digits.integer;
    StripLeadingZeros(integer);

    // Trailing zeros of the fractional part are at the front of the reversed digits.
    std::string& fractional_reversed = digits.fractional_reversed;
    StripLeadingZeros(fractional_reversed);

    bool const negative = decomposition.negative && !(integer.empty() && fractional_reversed.empty());

    std::string text;
    text.reserve(integer.size() + fractional_reversed.size() + 3);

    if (negative)
    {
        text.push_back('-');
    }

    if (integer.empty())
    {
        text.push_back('0');
    }
    else
    {
        text.append(integer);
    }

    if (!fractional_reversed.empty())
    {
        text.push_back('.');
        text.append(fractional_reversed.rbegin(), fractional_reversed.rend());
    }

    return {std::move(text), true};
}

decround::ReassembleResult decround::RoundDecimalString(std::string_view text, int places)
{
    return Reassemble(RoundTo(DecomposeString(text), places));
}
