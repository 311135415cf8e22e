#include <catch2/catch.hpp>

#include "digits.h"

#include <string>

using namespace decround;

//==================================================================================================
// ShiftLeft / ShiftRight
//==================================================================================================

static void CheckShiftLeft(std::string const& int_in, std::string const& frac_in, std::string const& int_out, std::string const& frac_out)
{
    CAPTURE(int_in);
    CAPTURE(frac_in);

    auto digits = MakeDigitStacks(int_in, frac_in);
    ShiftLeft(digits);

    CHECK(digits.integer == int_out);
    CHECK(FractionalDigits(digits) == frac_out);
}

static void CheckShiftRight(std::string const& int_in, std::string const& frac_in, std::string const& int_out, std::string const& frac_out)
{
    CAPTURE(int_in);
    CAPTURE(frac_in);

    auto digits = MakeDigitStacks(int_in, frac_in);
    ShiftRight(digits);

    CHECK(digits.integer == int_out);
    CHECK(FractionalDigits(digits) == frac_out);
}

TEST_CASE("ShiftLeft")
{
    CheckShiftLeft("", "", "0", "");
    CheckShiftLeft("", "3", "3", "");
    CheckShiftLeft("1241924", "", "12419240", "");
    CheckShiftLeft("", "7251", "7", "251");
    CheckShiftLeft("8", "7251", "87", "251");
    CheckShiftLeft("8", "", "80", "");
}

TEST_CASE("ShiftRight")
{
    CheckShiftRight("", "", "", "0");
    CheckShiftRight("", "124", "", "0124");
    CheckShiftRight("7", "", "", "7");
    CheckShiftRight("", "7", "", "07");
    CheckShiftRight("3", "4", "", "34");
    CheckShiftRight("124567", "93121", "12456", "793121");
}

TEST_CASE("Shift - left then right restores the digits")
{
    auto digits = MakeDigitStacks("8", "7251");
    ShiftLeft(digits);
    ShiftRight(digits);
    CHECK(digits.integer == "8");
    CHECK(FractionalDigits(digits) == "7251");

    // The synthesized '0' comes back as a leading fractional zero.
    digits = MakeDigitStacks("8", "");
    ShiftLeft(digits);
    ShiftRight(digits);
    CHECK(digits.integer == "8");
    CHECK(FractionalDigits(digits) == "0");
}

TEST_CASE("Shift - count")
{
    auto digits = MakeDigitStacks("12", "345");

    Shift(digits, 0);
    CHECK(digits.integer == "12");
    CHECK(FractionalDigits(digits) == "345");

    Shift(digits, 5);
    CHECK(digits.integer == "1234500");
    CHECK(FractionalDigits(digits) == "");

    Shift(digits, -9);
    CHECK(digits.integer == "");
    CHECK(FractionalDigits(digits) == "001234500");

    digits = MakeDigitStacks("4", "");
    Shift(digits, 1000);
    CHECK(digits.integer.size() == 1001);
    CHECK(digits.integer.front() == '4');
    CHECK(digits.integer.find_first_not_of('0', 1) == std::string::npos);
}

//==================================================================================================
// IncrementDigits
//==================================================================================================

static std::string Increment(std::string digits)
{
    IncrementDigits(digits);
    return digits;
}

TEST_CASE("IncrementDigits")
{
    CHECK(Increment("") == "1");
    CHECK(Increment("1") == "2");
    CHECK(Increment("0") == "1");
    CHECK(Increment("6") == "7");
    CHECK(Increment("8") == "9");
    CHECK(Increment("9") == "10");
    CHECK(Increment("100231321") == "100231322");
    CHECK(Increment("999999999") == "1000000000");
    CHECK(Increment("998999999") == "999000000");
}

//==================================================================================================
// RoundsUp
//==================================================================================================

static bool FractionRoundsUp(std::string const& fractional)
{
    return RoundsUp(MakeDigitStacks("", fractional));
}

TEST_CASE("RoundsUp")
{
    CHECK(!FractionRoundsUp(""));
    CHECK(!FractionRoundsUp("1"));
    CHECK(!FractionRoundsUp("0"));
    CHECK(!FractionRoundsUp("4"));
    CHECK( FractionRoundsUp("5"));
    CHECK( FractionRoundsUp("6"));
    CHECK( FractionRoundsUp("8"));
    CHECK( FractionRoundsUp("9"));
    CHECK(!FractionRoundsUp("4999999999999"));
    CHECK( FractionRoundsUp("50000000000000000"));
    CHECK(!FractionRoundsUp("100231321"));
    CHECK( FractionRoundsUp("999999999"));
    CHECK( FractionRoundsUp("998999999"));
}

TEST_CASE("StripLeadingZeros / StripTrailingZeros")
{
    std::string s = "000120";
    StripLeadingZeros(s);
    CHECK(s == "120");
    StripTrailingZeros(s);
    CHECK(s == "12");

    s = "0000";
    StripLeadingZeros(s);
    CHECK(s.empty());

    s = "0000";
    StripTrailingZeros(s);
    CHECK(s.empty());

    s = "";
    StripTrailingZeros(s);
    CHECK(s.empty());
}
