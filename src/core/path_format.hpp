/**
 * @file path_format.hpp
 * @brief Нормализация строк путей без обращения к файловой системе
 *
 * Шаги выполняются в фиксированном порядке:
 * 1. запоминается завершающий `/`;
 * 2. удаляются ANSI-последовательности, результат проверяется на UTF-8;
 * 3. `\` заменяется на `/`;
 * 4. схлопываются повторяющиеся `/`;
 * 5. удаляются символы `* ? " < > |`;
 * 6. разрешаются `.` и `..` (выше корня строки подъём не выполняется);
 * 7. восстанавливается завершающий `/`;
 * 8. результат "./" заменяется пустой строкой.
 *
 * Примеры (настройки по умолчанию):
 * - "C:\\Users\\\\test" -> "C:/Users/test"
 * - "/path/with/*unfriendly?chars" -> "/path/with/unfriendlychars"
 * - "/home/user/dir/../Vault/" -> "/home/user/Vault/"
 * - "./home/file.txt" -> "home/file.txt"
 * - "./" -> ""
 */

#pragma once

#include "model/path_format_config.hpp"
#include "model/path_format_result.hpp"
#include <filesystem>
#include <string>
#include <string_view>

namespace textnorm::core {

using model::FsPathFormatResult;
using model::PathFormatConfig;
using model::PathFormatResult;

/// Символы, запрещённые в именах файлов Windows
inline constexpr std::string_view kUnfriendlyChars = "*?\"<>|";

/**
 * @brief Нормализовать строку пути с настройками по умолчанию
 */
[[nodiscard]] PathFormatResult formatPathString(std::string_view path);

/**
 * @brief Нормализовать строку пути
 *
 * Единственная возможная ошибка: InvalidText при включённом strip_ansi,
 * если после удаления escape-последовательностей байты не являются UTF-8.
 */
[[nodiscard]] PathFormatResult formatPathString(
    std::string_view path,
    const PathFormatConfig& config
);

/**
 * @brief Нормализовать std::filesystem::path с настройками по умолчанию
 */
[[nodiscard]] FsPathFormatResult formatPath(const std::filesystem::path& path);

/**
 * @brief Нормализовать std::filesystem::path
 *
 * Путь переводится в строку, нормализуется и собирается обратно.
 */
[[nodiscard]] FsPathFormatResult formatPath(
    const std::filesystem::path& path,
    const PathFormatConfig& config
);

/**
 * @brief Разрешить `.` и `..` в пути с разделителем `/`
 *
 * Пустые компоненты пропускаются, ведущий `/` сохраняется и не снимается
 * через `..`. Пустой результат без корня даёт ".".
 */
[[nodiscard]] std::string resolveDotComponents(std::string_view path);

} // namespace textnorm::core
