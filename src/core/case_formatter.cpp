/**
 * @file case_formatter.cpp
 * @brief Разбиение строки на слова и вывод в разных стилях именования
 */

#include "case_formatter.hpp"
#include "text_utils.hpp"

namespace textnorm::core {

namespace {

bool isSeparator(char c) noexcept {
    return c == '_' || c == ',' || c == '.' || c == '-' || c == ' ';
}

/// Первая буква заглавная, остальные строчные
void appendCapitalized(std::string& out, const std::string& word) {
    if (word.empty()) {
        return;
    }
    out.push_back(toAsciiUpper(word.front()));
    for (size_t i = 1; i < word.size(); ++i) {
        out.push_back(toAsciiLower(word[i]));
    }
}

} // namespace

std::vector<std::string> splitWords(std::string_view input) {
    // Проход 1: оставить буквы/цифры, серию разделителей заменить одним пробелом
    std::string compressed;
    compressed.reserve(input.size());
    bool prev_space = false;

    for (char c : input) {
        if (isAsciiAlnum(c)) {
            compressed.push_back(c);
            prev_space = false;
        } else if (isSeparator(c)) {
            if (!prev_space) {
                compressed.push_back(' ');
                prev_space = true;
            }
        }
    }

    // Проход 2: граница «строчная -> заглавная»
    std::string marked;
    marked.reserve(compressed.size() * 2);
    for (size_t i = 0; i < compressed.size(); ++i) {
        marked.push_back(compressed[i]);
        if (i + 1 < compressed.size() &&
            isAsciiLower(compressed[i]) && isAsciiUpper(compressed[i + 1])) {
            marked.push_back(' ');
        }
    }

    // Проход 3: нижний регистр и разбиение по пробелам
    std::vector<std::string> words;
    std::string current;
    for (char c : marked) {
        if (c == ' ') {
            if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(toAsciiLower(c));
        }
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }

    return words;
}

CaseFormatter::CaseFormatter(std::string_view input)
    : tokens_(splitWords(input)) {}

std::string CaseFormatter::join(std::string_view separator) const {
    std::string out;
    for (size_t i = 0; i < tokens_.size(); ++i) {
        if (i > 0) {
            out.append(separator);
        }
        out.append(tokens_[i]);
    }
    return out;
}

std::string CaseFormatter::toCamelCase() const {
    std::string out;
    for (size_t i = 0; i < tokens_.size(); ++i) {
        if (i == 0) {
            out.append(asciiToLower(tokens_[i]));
        } else {
            appendCapitalized(out, tokens_[i]);
        }
    }
    return out;
}

std::string CaseFormatter::toPascalCase() const {
    std::string out;
    for (const auto& word : tokens_) {
        appendCapitalized(out, word);
    }
    return out;
}

std::string CaseFormatter::toKebabCase() const {
    return asciiToLower(join("-"));
}

std::string CaseFormatter::toSnakeCase() const {
    return asciiToLower(join("_"));
}

std::string CaseFormatter::toDotCase() const {
    return asciiToLower(join("."));
}

std::string CaseFormatter::toTitleCase() const {
    std::string out;
    for (size_t i = 0; i < tokens_.size(); ++i) {
        if (i > 0) {
            out.push_back(' ');
        }
        appendCapitalized(out, tokens_[i]);
    }
    return out;
}

std::string CaseFormatter::toLowerCase() const {
    return asciiToLower(join(" "));
}

std::string CaseFormatter::toUpperCase() const {
    return asciiToUpper(join(" "));
}

std::string CaseFormatter::format(CaseStyle style) const {
    switch (style) {
    case CaseStyle::Camel: return toCamelCase();
    case CaseStyle::Pascal: return toPascalCase();
    case CaseStyle::Kebab: return toKebabCase();
    case CaseStyle::Snake: return toSnakeCase();
    case CaseStyle::Dot: return toDotCase();
    case CaseStyle::Title: return toTitleCase();
    case CaseStyle::Lower: return toLowerCase();
    case CaseStyle::Upper: return toUpperCase();
    }
    return {};
}

std::string camelCase(std::string_view input) { return CaseFormatter(input).toCamelCase(); }
std::string pascalCase(std::string_view input) { return CaseFormatter(input).toPascalCase(); }
std::string kebabCase(std::string_view input) { return CaseFormatter(input).toKebabCase(); }
std::string snakeCase(std::string_view input) { return CaseFormatter(input).toSnakeCase(); }
std::string dotCase(std::string_view input) { return CaseFormatter(input).toDotCase(); }
std::string titleCase(std::string_view input) { return CaseFormatter(input).toTitleCase(); }
std::string lowerCase(std::string_view input) { return CaseFormatter(input).toLowerCase(); }
std::string upperCase(std::string_view input) { return CaseFormatter(input).toUpperCase(); }

std::string formatCase(std::string_view input, CaseStyle style) {
    return CaseFormatter(input).format(style);
}

std::optional<CaseStyle> parseCaseStyle(std::string_view name) {
    auto words = splitWords(name);
    if (words.empty() || words.size() > 2) {
        return std::nullopt;
    }
    if (words.size() == 2 && words[1] != "case") {
        return std::nullopt;
    }

    for (CaseStyle style : model::kAllCaseStyles) {
        if (words.front() == model::caseStyleToString(style)) {
            return style;
        }
    }
    return std::nullopt;
}

} // namespace textnorm::core
