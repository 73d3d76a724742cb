/**
 * @file ansi_strip.hpp
 * @brief Удаление управляющих escape-последовательностей терминала
 */

#pragma once

#include <string>
#include <string_view>

namespace textnorm::core {

/**
 * @brief Удалить ANSI escape-последовательности из строки
 *
 * Распознаются:
 * - CSI: `ESC [` параметры (0x30-0x3F), промежуточные (0x20-0x2F), финальный байт (0x40-0x7E);
 * - OSC: `ESC ]` ... BEL или `ESC \`;
 * - DCS/SOS/PM/APC: `ESC P|X|^|_` ... `ESC \`;
 * - двухсимвольные `ESC <0x30-0x7E>` (`ESC 7`, `ESC c`) и выбор набора символов `ESC ( B`.
 *
 * Незавершённые и некорректные последовательности остаются в строке как есть.
 * Прочие байты (в том числе не-UTF-8) копируются без изменений.
 */
[[nodiscard]] std::string stripAnsiEscapes(std::string_view input);

/**
 * @brief Есть ли в строке хотя бы один байт ESC
 */
[[nodiscard]] bool containsEscape(std::string_view input) noexcept;

} // namespace textnorm::core
