#include "catch2/catch.hpp"

#include "lexical.h"

#include <string>

using safenum::LexicalStatus;

static LexicalStatus Scan(std::string const& str)
{
    safenum::DecimalSpan span;
    return safenum::ScanDecimal(str.data(), str.data() + str.size(), span);
}

TEST_CASE("Lexical - valid")
{
    CHECK(Scan("0") == LexicalStatus::ok);
    CHECK(Scan("-0") == LexicalStatus::ok);
    CHECK(Scan("0.0") == LexicalStatus::ok);
    CHECK(Scan("0.5") == LexicalStatus::ok);
    CHECK(Scan("-0.123") == LexicalStatus::ok);
    CHECK(Scan("7") == LexicalStatus::ok);
    CHECK(Scan("123.45") == LexicalStatus::ok);
    CHECK(Scan("1234.5678") == LexicalStatus::ok);
    CHECK(Scan("10") == LexicalStatus::ok);
    CHECK(Scan("100.000") == LexicalStatus::ok);
    CHECK(Scan("9007199254740993") == LexicalStatus::ok);
    CHECK(Scan("0.1234567890123456789") == LexicalStatus::ok);
    CHECK(Scan(std::string(10000, '9')) == LexicalStatus::ok);
}

TEST_CASE("Lexical - span")
{
    std::string const str = "-12.0340";

    safenum::DecimalSpan span;
    REQUIRE(safenum::ScanDecimal(str.data(), str.data() + str.size(), span) == LexicalStatus::ok);

    CHECK(span.negative);
    CHECK(std::string(span.integer_first, span.integer_last) == "12");
    CHECK(std::string(span.fraction_first, span.fraction_last) == "0340");

    std::string const integer = "42";
    REQUIRE(safenum::ScanDecimal(integer.data(), integer.data() + integer.size(), span) == LexicalStatus::ok);

    CHECK(!span.negative);
    CHECK(std::string(span.integer_first, span.integer_last) == "42");
    CHECK(span.fraction_first == span.fraction_last);
}

TEST_CASE("Lexical - empty")
{
    CHECK(Scan("") == LexicalStatus::empty);
}

TEST_CASE("Lexical - missing integer digits")
{
    CHECK(Scan("-") == LexicalStatus::missing_integer_digits);
    CHECK(Scan(".123") == LexicalStatus::missing_integer_digits);
    CHECK(Scan("-.5") == LexicalStatus::missing_integer_digits);
    CHECK(Scan(".") == LexicalStatus::missing_integer_digits);
}

TEST_CASE("Lexical - leading zero")
{
    CHECK(Scan("00") == LexicalStatus::leading_zero);
    CHECK(Scan("01") == LexicalStatus::leading_zero);
    CHECK(Scan("00123") == LexicalStatus::leading_zero);
    CHECK(Scan("-007") == LexicalStatus::leading_zero);
    CHECK(Scan("00.5") == LexicalStatus::leading_zero);
}

TEST_CASE("Lexical - missing fraction digits")
{
    CHECK(Scan("123.") == LexicalStatus::missing_fraction_digits);
    CHECK(Scan("0.") == LexicalStatus::missing_fraction_digits);
    CHECK(Scan("-1.") == LexicalStatus::missing_fraction_digits);
}

TEST_CASE("Lexical - invalid character")
{
    CHECK(Scan(" ") == LexicalStatus::invalid_character);
    CHECK(Scan(" 1") == LexicalStatus::invalid_character);
    CHECK(Scan("1 ") == LexicalStatus::invalid_character);
    CHECK(Scan("1\n") == LexicalStatus::invalid_character);
    CHECK(Scan("+1") == LexicalStatus::invalid_character);
    CHECK(Scan("--1") == LexicalStatus::invalid_character);
    CHECK(Scan("1-") == LexicalStatus::invalid_character);
    CHECK(Scan("1e5") == LexicalStatus::invalid_character);
    CHECK(Scan("1E5") == LexicalStatus::invalid_character);
    CHECK(Scan("0x123") == LexicalStatus::invalid_character);
    CHECK(Scan("1.2.3") == LexicalStatus::invalid_character);
    CHECK(Scan("1..2") == LexicalStatus::invalid_character);
    CHECK(Scan("1,000") == LexicalStatus::invalid_character);
    CHECK(Scan("1_000") == LexicalStatus::invalid_character);
    CHECK(Scan("abc") == LexicalStatus::invalid_character);
    CHECK(Scan("Infinity") == LexicalStatus::invalid_character);
    CHECK(Scan("-Infinity") == LexicalStatus::invalid_character);
    CHECK(Scan("NaN") == LexicalStatus::invalid_character);
    CHECK(Scan("1.5x") == LexicalStatus::invalid_character);
    CHECK(Scan("1.-5") == LexicalStatus::invalid_character);
    // U+0661 ARABIC-INDIC DIGIT ONE
    CHECK(Scan("\xD9\xA1") == LexicalStatus::invalid_character);
    CHECK(Scan("1\xD9\xA1") == LexicalStatus::invalid_character);
    // Embedded null
    CHECK(Scan(std::string("1\0" "2", 3)) == LexicalStatus::invalid_character);
}

TEST_CASE("Lexical - IsValidDecimal")
{
    auto valid = [](std::string const& str) {
        return safenum::IsValidDecimal(str.data(), str.data() + str.size());
    };

    CHECK(valid("0"));
    CHECK(valid("-3.25"));
    CHECK(!valid(""));
    CHECK(!valid("0123"));
    CHECK(!valid("1e-7"));
}

TEST_CASE("Lexical - status names")
{
    CHECK(std::string(safenum::LexicalStatusName(LexicalStatus::ok)) == "ok");
    CHECK(std::string(safenum::LexicalStatusName(LexicalStatus::leading_zero)) == "leading zero");
    CHECK(std::string(safenum::LexicalStatusName(LexicalStatus::invalid_character)) == "invalid character");
}
