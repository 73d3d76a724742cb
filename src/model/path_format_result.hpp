/**
 * @file path_format_result.hpp
 * @brief Результат и ошибки нормализации пути
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace textnorm::model {

/**
 * @brief Описание некорректной UTF-8 последовательности
 */
struct Utf8Error {
    size_t valid_up_to = 0;              ///< Длина корректного префикса (в байтах)
    std::optional<size_t> error_len;     ///< Длина некорректной последовательности; nullopt: строка оборвана

    [[nodiscard]] std::string toString() const {
        if (error_len.has_value()) {
            return "некорректная последовательность из " + std::to_string(*error_len) +
                   " байт по смещению " + std::to_string(valid_up_to);
        }
        return "неполная последовательность по смещению " + std::to_string(valid_up_to);
    }

    bool operator==(const Utf8Error& other) const noexcept = default;
};

/**
 * @brief Вид ошибки нормализации
 */
enum class PathFormatErrorKind {
    InvalidText     ///< После удаления ANSI-последовательностей строка не является UTF-8
};

/**
 * @brief Ошибка нормализации пути
 */
struct PathFormatError {
    PathFormatErrorKind kind = PathFormatErrorKind::InvalidText;
    Utf8Error cause;                     ///< Исходная ошибка декодирования

    [[nodiscard]] std::string message() const {
        return "Некорректный UTF-8 после удаления ANSI-последовательностей: " + cause.toString();
    }
};

/**
 * @brief Исключение при обращении к значению неуспешного результата
 */
class PathFormatException : public std::runtime_error {
public:
    explicit PathFormatException(const PathFormatError& error)
        : std::runtime_error(error.message())
        , error_(error) {}

    [[nodiscard]] const PathFormatError& error() const noexcept { return error_; }

private:
    PathFormatError error_;
};

/**
 * @brief Результат нормализации строки пути
 */
struct PathFormatResult {
    bool success = false;
    std::string path;                        ///< Нормализованный путь (при success)
    std::optional<PathFormatError> error;    ///< Ошибка (при !success)

    explicit operator bool() const noexcept { return success; }

    /**
     * @brief Нормализованный путь
     * @throws PathFormatException Если результат содержит ошибку
     */
    [[nodiscard]] const std::string& value() const {
        if (!success) {
            throw PathFormatException(error.value_or(PathFormatError{}));
        }
        return path;
    }
};

/**
 * @brief Результат нормализации std::filesystem::path
 */
struct FsPathFormatResult {
    bool success = false;
    std::filesystem::path path;
    std::optional<PathFormatError> error;

    explicit operator bool() const noexcept { return success; }

    [[nodiscard]] const std::filesystem::path& value() const {
        if (!success) {
            throw PathFormatException(error.value_or(PathFormatError{}));
        }
        return path;
    }
};

} // namespace textnorm::model
