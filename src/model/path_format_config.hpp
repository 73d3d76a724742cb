/**
 * @file path_format_config.hpp
 * @brief Настройки нормализации путей
 */

#pragma once

namespace textnorm::model {

/**
 * @brief Набор независимых шагов нормализации пути
 *
 * По умолчанию включены все шаги. Любая комбинация допустима.
 */
struct PathFormatConfig {
    /// Удалять ANSI escape-последовательности (`\x1b[31m`, `\x1b[0m` и т.п.).
    /// Без поддержки в сборке (TEXTNORM_STRIP_ANSI=OFF) флаг игнорируется.
    bool strip_ansi = true;

    /// Удалять символы, запрещённые в именах файлов Windows: `* ? " < > |`
    bool strip_unfriendly_chars = true;

    /// Разрешать `.` и `..` по строке, без обращения к файловой системе
    bool resolve_parent_dirs = true;

    /// Схлопывать повторяющиеся `/`: `/home//user` -> `/home/user`
    bool collapse_consecutive_slashes = true;

    /// Заменять `\` на `/`
    bool escape_backslashes = true;

    bool operator==(const PathFormatConfig& other) const noexcept = default;

    /**
     * @brief Конфигурация, в которой выключены все шаги
     */
    [[nodiscard]] static constexpr PathFormatConfig none() noexcept {
        PathFormatConfig config;
        config.strip_ansi = false;
        config.strip_unfriendly_chars = false;
        config.resolve_parent_dirs = false;
        config.collapse_consecutive_slashes = false;
        config.escape_backslashes = false;
        return config;
    }
};

} // namespace textnorm::model
