/**
 * @file case_formatter.hpp
 * @brief Разбиение строки на слова и вывод в разных стилях именования
 *
 * Строка разбивается на слова по разделителям `_ , . -` и пробелу, а также
 * по границе «строчная -> заглавная» (brewCoffee -> brew Coffee).
 * Символы, не являющиеся ASCII-буквами, цифрами или разделителями, удаляются
 * без образования границы: "b&rewCoffee" -> brew, coffee.
 */

#pragma once

#include "model/case_style.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace textnorm::core {

using model::CaseStyle;

/**
 * @brief Разбить строку на слова в нижнем регистре
 *
 * Слова непустые и состоят только из ASCII-букв и цифр.
 */
[[nodiscard]] std::vector<std::string> splitWords(std::string_view input);

/**
 * @brief Набор слов, полученный из строки, и его представления в разных стилях
 *
 * Слова вычисляются один раз в конструкторе и далее не изменяются.
 */
class CaseFormatter {
public:
    explicit CaseFormatter(std::string_view input);

    [[nodiscard]] const std::vector<std::string>& tokens() const noexcept { return tokens_; }
    [[nodiscard]] bool empty() const noexcept { return tokens_.empty(); }

    /// brewCoffee
    [[nodiscard]] std::string toCamelCase() const;
    /// BrewCoffee
    [[nodiscard]] std::string toPascalCase() const;
    /// brew-coffee
    [[nodiscard]] std::string toKebabCase() const;
    /// brew_coffee
    [[nodiscard]] std::string toSnakeCase() const;
    /// brew.coffee
    [[nodiscard]] std::string toDotCase() const;
    /// Brew Coffee
    [[nodiscard]] std::string toTitleCase() const;
    /// brew coffee
    [[nodiscard]] std::string toLowerCase() const;
    /// BREW COFFEE
    [[nodiscard]] std::string toUpperCase() const;

    [[nodiscard]] std::string format(CaseStyle style) const;

private:
    std::string join(std::string_view separator) const;

    std::vector<std::string> tokens_;
};

// Однократное преобразование без явного создания CaseFormatter

[[nodiscard]] std::string camelCase(std::string_view input);
[[nodiscard]] std::string pascalCase(std::string_view input);
[[nodiscard]] std::string kebabCase(std::string_view input);
[[nodiscard]] std::string snakeCase(std::string_view input);
[[nodiscard]] std::string dotCase(std::string_view input);
[[nodiscard]] std::string titleCase(std::string_view input);
[[nodiscard]] std::string lowerCase(std::string_view input);
[[nodiscard]] std::string upperCase(std::string_view input);

[[nodiscard]] std::string formatCase(std::string_view input, CaseStyle style);

/**
 * @brief Определить стиль по имени
 *
 * Имя само разбивается на слова, поэтому "snake", "Snake_Case",
 * "snake-case" и "snakeCase" дают CaseStyle::Snake.
 */
[[nodiscard]] std::optional<CaseStyle> parseCaseStyle(std::string_view name);

} // namespace textnorm::core
