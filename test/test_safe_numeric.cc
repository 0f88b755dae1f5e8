#include "catch2/catch.hpp"

#include "dragon4.h"
#include "ieee.h"
#include "safe_numeric.h"

#include <cstdint>
#include <random>
#include <string>

using safenum::SafeNumericStatus;

static SafeNumericStatus Check(std::string const& str)
{
    return safenum::CheckSafeNumeric(str.data(), str.data() + str.size());
}

TEST_CASE("IsSafeNumeric - accepted")
{
    CHECK(safenum::IsSafeNumeric("0"));
    CHECK(safenum::IsSafeNumeric("-0"));
    CHECK(safenum::IsSafeNumeric("0.0"));
    CHECK(safenum::IsSafeNumeric("-0.0"));
    CHECK(safenum::IsSafeNumeric("0.1"));
    CHECK(safenum::IsSafeNumeric("0.5"));
    CHECK(safenum::IsSafeNumeric("-0.123"));
    CHECK(safenum::IsSafeNumeric("123.45"));
    CHECK(safenum::IsSafeNumeric("1234.5678"));
    CHECK(safenum::IsSafeNumeric("100"));
    CHECK(safenum::IsSafeNumeric("1.50"));
    CHECK(safenum::IsSafeNumeric("9007199254740991"));
    CHECK(safenum::IsSafeNumeric("-9007199254740991"));
    CHECK(safenum::IsSafeNumeric("0.30000000000000004"));
    CHECK(safenum::IsSafeNumeric("0.12345678901234568"));
    CHECK(safenum::IsSafeNumeric("0." + std::string(323, '0') + "5"));
    CHECK(safenum::IsSafeNumeric("0.0000001"));
}

TEST_CASE("IsSafeNumeric - rejected")
{
    // Not a decimal numeral
    CHECK(!safenum::IsSafeNumeric(""));
    CHECK(!safenum::IsSafeNumeric(" "));
    CHECK(!safenum::IsSafeNumeric("abc"));
    CHECK(!safenum::IsSafeNumeric(" 1"));
    CHECK(!safenum::IsSafeNumeric("+1"));
    CHECK(!safenum::IsSafeNumeric("--1"));
    CHECK(!safenum::IsSafeNumeric(".123"));
    CHECK(!safenum::IsSafeNumeric("123."));
    CHECK(!safenum::IsSafeNumeric("00123"));
    CHECK(!safenum::IsSafeNumeric("1.2.3"));
    CHECK(!safenum::IsSafeNumeric("1e5"));
    CHECK(!safenum::IsSafeNumeric("0x123"));
    CHECK(!safenum::IsSafeNumeric("Infinity"));
    CHECK(!safenum::IsSafeNumeric("-Infinity"));
    CHECK(!safenum::IsSafeNumeric("NaN"));

    // Too large
    CHECK(!safenum::IsSafeNumeric("9007199254740992"));
    CHECK(!safenum::IsSafeNumeric("9007199254740993"));
    CHECK(!safenum::IsSafeNumeric("-9007199254740993"));
    CHECK(!safenum::IsSafeNumeric("1000000000000000000000"));
    CHECK(!safenum::IsSafeNumeric("1" + std::string(400, '0')));

    // Not the shortest representation of the nearest double
    CHECK(!safenum::IsSafeNumeric("0.1234567890123456789"));
    CHECK(!safenum::IsSafeNumeric("0.30000000000000001"));
    CHECK(!safenum::IsSafeNumeric("0.1000000000000000055511151231257827"));
    CHECK(!safenum::IsSafeNumeric("1.00000000000000005"));
    CHECK(!safenum::IsSafeNumeric("0." + std::string(400, '0') + "1"));
    CHECK(!safenum::IsSafeNumeric("0." + std::string(323, '0') + "4"));
}

TEST_CASE("IsSafeNumeric - null")
{
    char const* null = nullptr;
    CHECK(!safenum::IsSafeNumeric(null));
    CHECK(safenum::CheckSafeNumeric(nullptr, nullptr) == SafeNumericStatus::not_a_string);
}

TEST_CASE("IsSafeNumeric - overloads agree")
{
    std::string const str = "3.14";
    CHECK(safenum::IsSafeNumeric(str));
    CHECK(safenum::IsSafeNumeric(str.c_str()));
    CHECK(safenum::IsSafeNumeric(str.data(), str.data() + str.size()));

    // The range overload does not stop at a null character.
    std::string const embedded("1\0" "2", 3);
    CHECK(!safenum::IsSafeNumeric(embedded));
    CHECK(safenum::IsSafeNumeric(embedded.c_str()));
}

TEST_CASE("CheckSafeNumeric - status")
{
    CHECK(Check("0.1") == SafeNumericStatus::safe);
    CHECK(Check("") == SafeNumericStatus::empty);
    CHECK(Check("-") == SafeNumericStatus::missing_integer_digits);
    CHECK(Check(".5") == SafeNumericStatus::missing_integer_digits);
    CHECK(Check("007") == SafeNumericStatus::leading_zero);
    CHECK(Check("7.") == SafeNumericStatus::missing_fraction_digits);
    CHECK(Check("7,5") == SafeNumericStatus::invalid_character);
    CHECK(Check("9007199254740992") == SafeNumericStatus::exceeds_max_safe_integer);
    CHECK(Check("9007199254740991.5") == SafeNumericStatus::inexact_round_trip);
    CHECK(Check("0.1234567890123456789") == SafeNumericStatus::inexact_round_trip);

    CHECK(std::string(safenum::SafeNumericStatusName(SafeNumericStatus::safe)) == "safe");
    CHECK(std::string(safenum::SafeNumericStatusName(SafeNumericStatus::inexact_round_trip)) == "inexact round trip");
    CHECK(std::string(safenum::SafeNumericStatusName(SafeNumericStatus::exceeds_max_safe_integer)) == "exceeds max safe integer");
}

TEST_CASE("IsSafeNumeric - README cases")
{
    struct Case {
        char const* input;
        bool expected;
    };

    static Case const cases[] = {
        {"",                      false},
        {" ",                     false},
        {"123.45",                true },
        {".123",                  false},
        {"123.",                  false},
        {"00123",                 false},
        {"1e5",                   false},
        {"0x123",                 false},
        {"9007199254740993",      false},
        {"0.1234567890123456789", false},
        {"Infinity",              false},
        {"-Infinity",             false},
    };

    for (auto const& c : cases)
    {
        CAPTURE(c.input);
        CHECK(safenum::IsSafeNumeric(c.input) == c.expected);
    }
}

// Strings produced by the formatter are fixed points of the round trip.
TEST_CASE("IsSafeNumeric - fixed points")
{
    std::mt19937_64 random(4321);

    for (int i = 0; i < 5000; ++i)
    {
        double const value = safenum::ReinterpretBits<double>(random() % safenum::IEEEDouble::ExponentMask);
        if (value > 9007199254740991.0)
            continue;

        std::string const str = safenum::ToString(safenum::ToShortestDecimal(value));
        CAPTURE(str);
        CHECK(safenum::IsSafeNumeric(str));
    }
}

TEST_CASE("IsSafeNumeric - short decimals")
{
    std::mt19937_64 random(8765);
    std::uniform_int_distribution<int> num_digits_dist(1, 15);
    std::uniform_int_distribution<int> digit_dist(0, 9);

    // At most 15 significant digits always survive the round trip.
    for (int i = 0; i < 5000; ++i)
    {
        int const num_digits = num_digits_dist(random);
        std::uniform_int_distribution<int> point_dist(0, num_digits);
        int const point = point_dist(random);

        std::string str;
        if (random() % 2 == 0)
            str += '-';

        std::string digits;
        for (int k = 0; k < num_digits; ++k)
            digits += static_cast<char>('0' + digit_dist(random));

        std::string integer = digits.substr(0, static_cast<size_t>(point));
        std::string const fraction = digits.substr(static_cast<size_t>(point));

        auto const first_nonzero = integer.find_first_not_of('0');
        integer = (first_nonzero == std::string::npos) ? "0" : integer.substr(first_nonzero);

        str += integer;
        if (!fraction.empty())
        {
            str += '.';
            str += fraction;
        }

        CAPTURE(str);
        CHECK(safenum::IsSafeNumeric(str));
    }
}

// Appending digits to a decimal with 17 significant digits changes its value
// without changing the nearest double.
TEST_CASE("IsSafeNumeric - extra digits")
{
    std::mt19937_64 random(2468);

    for (int i = 0; i < 1000; ++i)
    {
        double const value = safenum::ReinterpretBits<double>(random() % safenum::IEEEDouble::ExponentMask);
        if (value == 0 || value > 9007199254740991.0)
            continue;

        std::string str = safenum::ToString(safenum::ToShortestDecimal(value));
        if (str.find('.') == std::string::npos)
            str += '.';
        str += "00000000000000000000000000000001";

        CAPTURE(str);
        CHECK(!safenum::IsSafeNumeric(str));
    }
}
