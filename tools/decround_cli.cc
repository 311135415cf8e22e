// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "decround.h"

#include <charconv>
#include <cstdio>
#include <cstring>
#include <system_error>
#include <utility>

enum class OutputMode {
    text,
    single,
    double_,
};

static void PrintUsage(FILE* out)
{
    fprintf(out,
        "usage: decround-cli [-n PLACES] [-f|-d] VALUE...\n"
        "\n"
        "  -n PLACES  round half-up to PLACES digits after the decimal point\n"
        "             (negative PLACES round to a multiple of 10^-PLACES)\n"
        "  -f         also print the nearest single-precision number\n"
        "  -d         also print the nearest double-precision number\n");
}

static bool ParsePlaces(char const* arg, int& places)
{
    char const* const last = arg + std::strlen(arg);
    char const* first = arg;
    if (first != last && *first == '+')
        ++first;

    auto const res = std::from_chars(first, last, places);
    return res.ec == std::errc{} && res.ptr == last && first != last;
}

static bool Process(char const* arg, bool round, int places, OutputMode mode)
{
    auto decomposition = decround::DecomposeString(arg);
    if (round)
    {
        decomposition = decround::RoundTo(std::move(decomposition), places);
    }

    auto const joined = decround::Reassemble(decomposition);
    if (!joined.ok)
    {
        fprintf(stderr, "decround-cli: invalid number: '%s'\n", arg);
        return false;
    }

    switch (mode)
    {
    case OutputMode::text:
        printf("%s\n", joined.text.c_str());
        break;
    case OutputMode::single:
        {
            auto const res = decround::ToFloat(decomposition);
            if (res.status != decround::ConversionStatus::ok)
            {
                fprintf(stderr, "decround-cli: '%s': %s\n", arg, decround::ToString(res.status));
                return false;
            }
            printf("%s %s\n", joined.text.c_str(), decround::Stringify(res.value).c_str());
        }
        break;
    case OutputMode::double_:
        {
            auto const res = decround::ToDouble(decomposition);
            if (res.status != decround::ConversionStatus::ok)
            {
                fprintf(stderr, "decround-cli: '%s': %s\n", arg, decround::ToString(res.status));
                return false;
            }
            printf("%s %s\n", joined.text.c_str(), decround::Stringify(res.value).c_str());
        }
        break;
    }

    return true;
}

int main(int argc, char** argv)
{
    bool round = false;
    int places = 0;
    OutputMode mode = OutputMode::text;

    int i = 1;
    for ( ; i < argc; ++i)
    {
        char const* const arg = argv[i];

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0)
        {
            PrintUsage(stdout);
            return 0;
        }
        else if (std::strcmp(arg, "-n") == 0)
        {
            if (i + 1 >= argc || !ParsePlaces(argv[i + 1], places))
            {
                fprintf(stderr, "decround-cli: -n requires an integer argument\n");
                PrintUsage(stderr);
                return 2;
            }
            round = true;
            ++i;
        }
        else if (std::strcmp(arg, "-f") == 0)
        {
            mode = OutputMode::single;
        }
        else if (std::strcmp(arg, "-d") == 0)
        {
            mode = OutputMode::double_;
        }
        else if (std::strcmp(arg, "--") == 0)
        {
            ++i;
            break;
        }
        else
        {
            // Values may start with '-', so anything else ends the options.
            break;
        }
    }

    if (i >= argc)
    {
        PrintUsage(stderr);
        return 2;
    }

    int status = 0;
    for ( ; i < argc; ++i)
    {
        if (!Process(argv[i], round, places, mode))
            status = 1;
    }

    return status;
}
