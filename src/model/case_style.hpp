/**
 * @file case_style.hpp
 * @brief Стили именования (camelCase, snake_case и т.д.)
 */

#pragma once

#include <array>
#include <string_view>

namespace textnorm::model {

/**
 * @brief Стиль записи последовательности слов
 */
enum class CaseStyle {
    Camel,      ///< brewCoffee
    Pascal,     ///< BrewCoffee
    Kebab,      ///< brew-coffee
    Snake,      ///< brew_coffee
    Dot,        ///< brew.coffee
    Title,      ///< Brew Coffee
    Lower,      ///< brew coffee
    Upper       ///< BREW COFFEE
};

/// Все стили в порядке вывода (для `textnorm case --all`)
inline constexpr std::array<CaseStyle, 8> kAllCaseStyles = {
    CaseStyle::Camel,
    CaseStyle::Pascal,
    CaseStyle::Kebab,
    CaseStyle::Snake,
    CaseStyle::Dot,
    CaseStyle::Title,
    CaseStyle::Lower,
    CaseStyle::Upper
};

/**
 * @brief Короткое имя стиля (используется в CLI и отчётах)
 */
[[nodiscard]] inline std::string_view caseStyleToString(CaseStyle style) noexcept {
    switch (style) {
    case CaseStyle::Camel: return "camel";
    case CaseStyle::Pascal: return "pascal";
    case CaseStyle::Kebab: return "kebab";
    case CaseStyle::Snake: return "snake";
    case CaseStyle::Dot: return "dot";
    case CaseStyle::Title: return "title";
    case CaseStyle::Lower: return "lower";
    case CaseStyle::Upper: return "upper";
    }
    return "unknown";
}

} // namespace textnorm::model
