/**
 * @file test_text_utils.cpp
 * @brief Unit-тесты проверки UTF-8 и ASCII-регистра
 */

#include <doctest/doctest.h>
#include "core/text_utils.hpp"
#include <string>

using namespace textnorm::core;

TEST_CASE("validateUtf8 accepts well-formed text") {
    CHECK_FALSE(validateUtf8("").has_value());
    CHECK_FALSE(validateUtf8("plain ascii /path").has_value());
    CHECK_FALSE(validateUtf8("\xD0\x9F\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82").has_value());  // Привет
    CHECK_FALSE(validateUtf8("\xE2\x82\xAC").has_value());          // €
    CHECK_FALSE(validateUtf8("\xF0\x9F\x98\x80").has_value());      // U+1F600
    CHECK_FALSE(validateUtf8("\xF4\x8F\xBF\xBF").has_value());      // U+10FFFF
    CHECK_FALSE(validateUtf8(std::string("a\0b", 3)).has_value());
}

TEST_CASE("validateUtf8 reports the first invalid sequence") {
    SUBCASE("Недопустимый ведущий байт") {
        auto err = validateUtf8("ab\xFF" "cd");
        REQUIRE(err.has_value());
        CHECK(err->valid_up_to == 2);
        CHECK(err->error_len == std::optional<size_t>(1));
    }

    SUBCASE("Одиночный байт продолжения") {
        auto err = validateUtf8("\x80");
        REQUIRE(err.has_value());
        CHECK(err->valid_up_to == 0);
        CHECK(err->error_len == std::optional<size_t>(1));
    }

    SUBCASE("Overlong-формы") {
        auto two = validateUtf8("\xC0\xAF");
        REQUIRE(two.has_value());
        CHECK(two->error_len == std::optional<size_t>(1));

        auto three = validateUtf8("\xE0\x80\xAF");
        REQUIRE(three.has_value());
        CHECK(three->valid_up_to == 0);
        CHECK(three->error_len == std::optional<size_t>(1));
    }

    SUBCASE("Суррогаты и выход за U+10FFFF") {
        auto surrogate = validateUtf8("x\xED\xA0\x80");
        REQUIRE(surrogate.has_value());
        CHECK(surrogate->valid_up_to == 1);
        CHECK(surrogate->error_len == std::optional<size_t>(1));

        auto too_big = validateUtf8("\xF4\x90\x80\x80");
        REQUIRE(too_big.has_value());
        CHECK(too_big->error_len == std::optional<size_t>(1));
    }

    SUBCASE("Ошибка в третьем и четвёртом байте") {
        auto third = validateUtf8("\xE2\x82" "A");
        REQUIRE(third.has_value());
        CHECK(third->error_len == std::optional<size_t>(2));

        auto fourth = validateUtf8("ok\xF0\x9F\x98" "A");
        REQUIRE(fourth.has_value());
        CHECK(fourth->valid_up_to == 2);
        CHECK(fourth->error_len == std::optional<size_t>(3));
    }

    SUBCASE("Оборванная последовательность") {
        auto err = validateUtf8("abc\xF0\x9F");
        REQUIRE(err.has_value());
        CHECK(err->valid_up_to == 3);
        CHECK_FALSE(err->error_len.has_value());
        CHECK(err->toString().find("3") != std::string::npos);
    }
}

TEST_CASE("ASCII case helpers leave other bytes untouched") {
    CHECK(asciiToLower("BrEw 42_COFFEE") == "brew 42_coffee");
    CHECK(asciiToUpper("brew coffee") == "BREW COFFEE");
    CHECK(asciiToLower("\xD0\x9F") == "\xD0\x9F");
    CHECK(asciiToUpper("\xC3\xA9") == "\xC3\xA9");

    CHECK(isAsciiAlnum('z'));
    CHECK(isAsciiAlnum('7'));
    CHECK_FALSE(isAsciiAlnum('_'));
    CHECK_FALSE(isAsciiAlnum(static_cast<char>(0xC3)));
    CHECK(toAsciiUpper('q') == 'Q');
    CHECK(toAsciiLower('Q') == 'q');
    CHECK(toAsciiLower('1') == '1');
}
