/**
 * @file cli_commands.hpp
 * @brief Команды CLI `textnorm case` и `textnorm path`
 */

#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace textnorm::app {

/**
 * @brief Потоки ввода/вывода команды (в тестах подменяются на stringstream)
 */
struct CommandStreams {
    std::istream& in;
    std::ostream& out;
    std::ostream& err;
};

/**
 * @brief `textnorm case <style>|--all <text>...`
 *
 * Каждый аргумент выводится отдельной строкой в выбранном стиле.
 * С `--all` для каждого аргумента печатаются все восемь стилей в виде
 * `style: value`.
 *
 * @param args Аргументы после слова `case`
 * @return Код завершения (0: успех, 1: ошибка использования)
 */
int runCaseCommand(const std::vector<std::string>& args, CommandStreams streams);

/**
 * @brief `textnorm path [options] <path>...`
 *
 * Опции: `--config <file>`, `--no-strip-ansi`, `--no-strip-chars`,
 * `--no-resolve-parents`, `--no-collapse-slashes`, `--no-backslashes`,
 * `--stdin` (пути построчно из stdin), `--dump-config`.
 * Флаги `--no-*` применяются поверх файла настроек.
 *
 * @return 0: все пути нормализованы, 1: ошибка использования или хотя бы одного пути
 */
int runPathCommand(const std::vector<std::string>& args, CommandStreams streams);

} // namespace textnorm::app
