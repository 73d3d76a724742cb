/**
 * @file test_ansi_strip.cpp
 * @brief Unit-тесты удаления escape-последовательностей терминала
 */

#include <doctest/doctest.h>
#include "core/ansi_strip.hpp"
#include <string>

using namespace textnorm::core;

TEST_CASE("stripAnsiEscapes removes SGR colors") {
    CHECK(stripAnsiEscapes("\x1b[31m/path\x1b[0m") == "/path");
    CHECK(stripAnsiEscapes("\x1b[1;4;38;5;208mbold\x1b[m") == "bold");
    CHECK(stripAnsiEscapes("plain text") == "plain text");
    CHECK(stripAnsiEscapes("") == "");
}

TEST_CASE("stripAnsiEscapes removes other CSI sequences") {
    CHECK(stripAnsiEscapes("\x1b[2Jclear\x1b[H") == "clear");
    CHECK(stripAnsiEscapes("a\x1b[?25lb\x1b[?25hc") == "abc");
    CHECK(stripAnsiEscapes("x\x1b[1 qy") == "xy");
}

TEST_CASE("stripAnsiEscapes removes OSC and string sequences") {
    SUBCASE("OSC с BEL") {
        CHECK(stripAnsiEscapes("\x1b]0;title\x07/home") == "/home");
    }

    SUBCASE("OSC 8 гиперссылка с ST") {
        CHECK(stripAnsiEscapes("\x1b]8;;file:///tmp\x1b\\link\x1b]8;;\x1b\\") == "link");
    }

    SUBCASE("DCS") {
        CHECK(stripAnsiEscapes("a\x1bPpayload\x1b\\b") == "ab");
    }
}

TEST_CASE("stripAnsiEscapes removes short escapes") {
    CHECK(stripAnsiEscapes("a\x1b" "7b\x1b" "8c") == "abc");
    CHECK(stripAnsiEscapes("\x1b(Bascii") == "ascii");
    CHECK(stripAnsiEscapes("a\x1b" "cb") == "ab");
}

TEST_CASE("stripAnsiEscapes keeps malformed sequences") {
    SUBCASE("Незавершённый CSI") {
        CHECK(stripAnsiEscapes("path\x1b[31") == "path\x1b[31");
    }

    SUBCASE("ESC в конце строки") {
        CHECK(stripAnsiEscapes("path\x1b") == "path\x1b");
    }

    SUBCASE("Незавершённый OSC") {
        CHECK(stripAnsiEscapes("\x1b]0;title") == "\x1b]0;title");
    }

    SUBCASE("ESC перед управляющим символом") {
        CHECK(stripAnsiEscapes("a\x1b\nb") == "a\x1b\nb");
    }
}

TEST_CASE("stripAnsiEscapes passes non-escape bytes through") {
    std::string utf8 = "\xD0\xBF\xD1\x83\xD1\x82\xD1\x8C";
    CHECK(stripAnsiEscapes("\x1b[32m" + utf8 + "\x1b[0m") == utf8);
    CHECK(stripAnsiEscapes("\xff\x1b[0m\xfe") == "\xff\xfe");

    CHECK(containsEscape("a\x1b[0m"));
    CHECK_FALSE(containsEscape("plain"));
}
