/**
 * @file text_utils.hpp
 * @brief Проверка UTF-8 и ASCII-преобразования регистра
 */

#pragma once

#include "model/path_format_result.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace textnorm::core {

/**
 * @brief Проверка корректности UTF-8
 *
 * Следует таблице корректных последовательностей Unicode: без overlong-форм,
 * суррогатов и кодовых точек выше U+10FFFF.
 *
 * @return nullopt для корректной строки, иначе описание первой ошибки
 */
[[nodiscard]] std::optional<model::Utf8Error> validateUtf8(std::string_view input) noexcept;

/**
 * @brief Перевод в нижний регистр только для ASCII, остальные байты без изменений
 */
[[nodiscard]] std::string asciiToLower(std::string_view input);

/**
 * @brief Перевод в верхний регистр только для ASCII, остальные байты без изменений
 */
[[nodiscard]] std::string asciiToUpper(std::string_view input);

[[nodiscard]] constexpr bool isAsciiLower(char c) noexcept { return c >= 'a' && c <= 'z'; }
[[nodiscard]] constexpr bool isAsciiUpper(char c) noexcept { return c >= 'A' && c <= 'Z'; }
[[nodiscard]] constexpr bool isAsciiDigit(char c) noexcept { return c >= '0' && c <= '9'; }

[[nodiscard]] constexpr bool isAsciiAlnum(char c) noexcept {
    return isAsciiLower(c) || isAsciiUpper(c) || isAsciiDigit(c);
}

[[nodiscard]] constexpr char toAsciiLower(char c) noexcept {
    return isAsciiUpper(c) ? static_cast<char>(c + 32) : c;
}

[[nodiscard]] constexpr char toAsciiUpper(char c) noexcept {
    return isAsciiLower(c) ? static_cast<char>(c - 32) : c;
}

} // namespace textnorm::core
