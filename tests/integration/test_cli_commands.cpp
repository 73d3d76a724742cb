/**
 * @file test_cli_commands.cpp
 * @brief Интеграционные тесты команд `case` и `path`
 */

#include <doctest/doctest.h>
#include "app/cli_commands.hpp"
#include "io/config_io.hpp"
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

using textnorm::app::CommandStreams;
using textnorm::app::runCaseCommand;
using textnorm::app::runPathCommand;

namespace {

struct CapturedRun {
    int exit_code = 0;
    std::string out;
    std::string err;
};

template <typename Command>
CapturedRun capture(Command command, const std::vector<std::string>& args, const std::string& input = {}) {
    std::istringstream in(input);
    std::ostringstream out;
    std::ostringstream err;
    CapturedRun run;
    run.exit_code = command(args, CommandStreams{in, out, err});
    run.out = out.str();
    run.err = err.str();
    return run;
}

} // namespace

TEST_CASE("case command") {
    SUBCASE("Один стиль, несколько аргументов") {
        auto run = capture(runCaseCommand, {"snake", "brewCoffee", "Brew.Coffee"});
        CHECK(run.exit_code == 0);
        CHECK(run.out == "brew_coffee\nbrew_coffee\n");
        CHECK(run.err.empty());
    }

    SUBCASE("Имя стиля в произвольном написании") {
        auto run = capture(runCaseCommand, {"PascalCase", "brew_coffee"});
        CHECK(run.exit_code == 0);
        CHECK(run.out == "BrewCoffee\n");
    }

    SUBCASE("Все стили") {
        auto run = capture(runCaseCommand, {"--all", "brewCoffee"});
        CHECK(run.exit_code == 0);
        CHECK(run.out ==
              "camel: brewCoffee\n"
              "pascal: BrewCoffee\n"
              "kebab: brew-coffee\n"
              "snake: brew_coffee\n"
              "dot: brew.coffee\n"
              "title: Brew Coffee\n"
              "lower: brew coffee\n"
              "upper: BREW COFFEE\n");
    }

    SUBCASE("Пустой результат печатается пустой строкой") {
        auto run = capture(runCaseCommand, {"kebab", "&&&"});
        CHECK(run.exit_code == 0);
        CHECK(run.out == "\n");
    }

    SUBCASE("Ошибки использования") {
        auto missing = capture(runCaseCommand, {"snake"});
        CHECK(missing.exit_code == 1);
        CHECK(missing.err.find("usage") != std::string::npos);

        auto unknown = capture(runCaseCommand, {"screaming", "brew"});
        CHECK(unknown.exit_code == 1);
        CHECK(unknown.err.find("screaming") != std::string::npos);
        CHECK(unknown.out.empty());
    }
}

TEST_CASE("path command") {
    SUBCASE("Пути из аргументов") {
        auto run = capture(runPathCommand, {"C:\\Users\\\\test", "./home/path/", "./"});
        CHECK(run.exit_code == 0);
        CHECK(run.out == "C:/Users/test\nhome/path/\n\n");
    }

    SUBCASE("Флаги отключения шагов") {
        auto run = capture(runPathCommand, {"--no-resolve-parents", "--no-strip-chars", "/a/../b?"});
        CHECK(run.exit_code == 0);
        CHECK(run.out == "/a/../b?\n");

        auto slashes = capture(runPathCommand, {"--no-collapse-slashes", "--no-backslashes",
                                                "--no-resolve-parents", "a\\b//c"});
        CHECK(slashes.out == "a\\b//c\n");
    }

    SUBCASE("Пути из stdin") {
        auto run = capture(runPathCommand, {"--stdin"}, "/x//y/\r\na/b/../c\n");
        CHECK(run.exit_code == 0);
        CHECK(run.out == "/x/y/\na/c\n");
    }

    SUBCASE("Путь после -- не считается опцией") {
        auto run = capture(runPathCommand, {"--", "--weird/../name"});
        CHECK(run.exit_code == 0);
        CHECK(run.out == "name\n");
    }

    SUBCASE("Вывод итоговых настроек") {
        auto run = capture(runPathCommand, {"--dump-config", "--no-strip-ansi"});
        CHECK(run.exit_code == 0);
        auto config = textnorm::io::pathFormatConfigFromJson(run.out);
        CHECK_FALSE(config.strip_ansi);
        CHECK(config.resolve_parent_dirs);
    }

    SUBCASE("Ошибки использования") {
        auto empty = capture(runPathCommand, {});
        CHECK(empty.exit_code == 1);
        CHECK(empty.err.find("usage") != std::string::npos);

        auto unknown = capture(runPathCommand, {"--frobnicate", "a"});
        CHECK(unknown.exit_code == 1);
        CHECK(unknown.err.find("--frobnicate") != std::string::npos);

        auto dangling_config = capture(runPathCommand, {"a", "--config"});
        CHECK(dangling_config.exit_code == 1);
        CHECK(dangling_config.out.empty());
        CHECK(dangling_config.err.find("требует") != std::string::npos);
        CHECK(dangling_config.err.find("Неизвестная опция") == std::string::npos);

        auto missing_config = capture(runPathCommand, {"--config", "/nonexistent/textnorm.json", "a"});
        CHECK(missing_config.exit_code == 1);
        CHECK(missing_config.out.empty());
    }
}

TEST_CASE("path command with configuration file") {
    auto fixture = std::filesystem::path(TEXTNORM_SOURCE_DIR) / "tests" / "fixtures" / "path_format_partial.json";
    auto run = capture(runPathCommand, {"--config", fixture.string(), "/a//b/../c*"});
    CHECK(run.exit_code == 0);
    CHECK(run.out == "/a/b/../c*\n");
}

#if defined(TEXTNORM_HAS_ANSI_STRIP) && TEXTNORM_HAS_ANSI_STRIP

TEST_CASE("path command reports invalid text and continues") {
    auto run = capture(runPathCommand, {"/ok\x1b[0m/", "/bad\xff", "/next"});
    CHECK(run.exit_code == 1);
    CHECK(run.out == "/ok/\n/next\n");
    CHECK(run.err.find("Ошибка нормализации пути") != std::string::npos);
}

#endif
