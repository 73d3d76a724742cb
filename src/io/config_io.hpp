/**
 * @file config_io.hpp
 * @brief Чтение и запись настроек нормализации путей (JSON)
 *
 * Формат файла:
 * @code
 * {
 *   "strip_ansi": true,
 *   "strip_unfriendly_chars": true,
 *   "resolve_parent_dirs": true,
 *   "collapse_consecutive_slashes": true,
 *   "escape_backslashes": true
 * }
 * @endcode
 * Отсутствующие ключи сохраняют значения по умолчанию, неизвестные игнорируются.
 */

#pragma once

#include "model/path_format_config.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>

namespace textnorm::io {

using model::PathFormatConfig;

/**
 * @brief Ошибка чтения настроек
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Разобрать настройки из JSON-строки
 * @throws ConfigError Некорректный JSON, не объект или значение не bool
 */
[[nodiscard]] PathFormatConfig pathFormatConfigFromJson(const std::string& json);

/**
 * @brief Сериализовать настройки в JSON
 */
[[nodiscard]] std::string pathFormatConfigToJson(const PathFormatConfig& config, int indent = 2);

/**
 * @brief Загрузить настройки из файла
 * @throws ConfigError При ошибке чтения или разбора
 */
[[nodiscard]] PathFormatConfig loadPathFormatConfig(const std::filesystem::path& path);

/**
 * @brief Сохранить настройки в файл (атомарно)
 * @throws ConfigError При ошибке записи
 */
void savePathFormatConfig(const PathFormatConfig& config, const std::filesystem::path& path);

} // namespace textnorm::io
