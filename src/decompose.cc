// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "decompose.h"

#include "digits.h"

#include <charconv>
#include <system_error>

namespace {

// Returns the length of the whitespace character starting at 'next', or 0 if there is none.
// Recognizes ASCII whitespace and the UTF-8 encodings of the Unicode White_Space characters.
int WhitespaceLength(char const* next, char const* last)
{
    auto const len = last - next;
    auto const b0 = static_cast<unsigned char>(next[0]);

    switch (b0)
    {
    case '\t':
    case '\n':
    case '\v':
    case '\f':
    case '\r':
    case ' ':
        return 1;
    case 0xC2: // U+0085, U+00A0
        if (len >= 2)
        {
            auto const b1 = static_cast<unsigned char>(next[1]);
            if (b1 == 0x85 || b1 == 0xA0)
                return 2;
        }
        return 0;
    case 0xE1: // U+1680
        if (len >= 3 && static_cast<unsigned char>(next[1]) == 0x9A && static_cast<unsigned char>(next[2]) == 0x80)
            return 3;
        return 0;
    case 0xE2: // U+2000...U+200A, U+2028, U+2029, U+202F, U+205F
        if (len >= 3)
        {
            auto const b1 = static_cast<unsigned char>(next[1]);
            auto const b2 = static_cast<unsigned char>(next[2]);
            if (b1 == 0x80 && ((b2 >= 0x80 && b2 <= 0x8A) || b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF))
                return 3;
            if (b1 == 0x81 && b2 == 0x9F)
                return 3;
        }
        return 0;
    case 0xE3: // U+3000
        if (len >= 3 && static_cast<unsigned char>(next[1]) == 0x80 && static_cast<unsigned char>(next[2]) == 0x80)
            return 3;
        return 0;
    default:
        return 0;
    }
}

std::string RemoveSeparators(std::string_view text)
{
    std::string result;
    result.reserve(text.size());

    char const* next = text.data();
    char const* const last = text.data() + text.size();
    while (next != last)
    {
        if (*next == ',')
        {
            ++next;
            continue;
        }

        int const ws = WhitespaceLength(next, last);
        if (ws > 0)
        {
            next += ws;
            continue;
        }

        result.push_back(*next);
        ++next;
    }

    return result;
}

char const* SkipDigits(char const* next, char const* last)
{
    while (next != last && decround::IsDigit(*next))
    {
        ++next;
    }
    return next;
}

// Skips one of the exponent markers "e", "x10^" and "*10^" (case-insensitive).
// Returns nullptr if there is none.
char const* SkipExponentMarker(char const* next, char const* last)
{
    if (*next == 'e' || *next == 'E')
        return next + 1;

    if (*next == 'x' || *next == 'X' || *next == '*')
    {
        if (last - next >= 4 && next[1] == '1' && next[2] == '0' && next[3] == '^')
            return next + 4;
    }

    return nullptr;
}

} // namespace

decround::Decomposition decround::DecomposeString(std::string_view text)
{
    std::string const str = RemoveSeparators(text);

    char const* next = str.data();
    char const* const last = str.data() + str.size();

// [+-]

    bool negative = false;
    if (next != last && (*next == '-' || *next == '+'))
    {
        negative = (*next == '-');
        ++next;
    }

// int

    char const* const int_first = next;
    next = SkipDigits(next, last);
    char const* const int_last = next;

    if (int_first == int_last)
        return {};

// frac

    char const* frac_first = next;
    char const* frac_last = next;

    if (next != last && *next == '.')
    {
        ++next;
        frac_first = next;
        next = SkipDigits(next, last);
        frac_last = next;

        if (frac_first == frac_last)
            return {};
    }

// exp

    int exponent = 0;

    if (next != last)
    {
        next = SkipExponentMarker(next, last);
        if (next == nullptr)
            return {};

        char const* exp_first = next;
        if (next != last && (*next == '-' || *next == '+'))
        {
            ++next;
        }

        char const* const exp_digits = next;
        next = SkipDigits(next, last);
        if (next == exp_digits || next != last)
            return {};

        // std::from_chars does not accept a leading '+'.
        if (*exp_first == '+')
            ++exp_first;

        auto const res = std::from_chars(exp_first, last, exponent);
        if (res.ec != std::errc{} || res.ptr != last)
        {
            // The exponent does not fit into an int.
            return {};
        }
    }

    Decomposition result;

    result.integer.assign(int_first, int_last);
    StripLeadingZeros(result.integer);

    result.fractional.assign(frac_first, frac_last);
    StripTrailingZeros(result.fractional);

    // Zero is never negative.
    result.negative = negative && !(result.integer.empty() && result.fractional.empty());
    result.exponent = exponent;
    result.valid = true;

    return result;
}
