/**
 * @file text_utils.cpp
 * @brief Проверка UTF-8 и ASCII-преобразования регистра
 */

#include "text_utils.hpp"

namespace textnorm::core {

namespace {

bool isContinuation(unsigned char c) noexcept {
    return (c & 0xC0) == 0x80;
}

/**
 * @brief Допустимый диапазон второго байта для ведущего байта
 *
 * Исключает overlong-формы (E0, F0), суррогаты (ED) и значения выше U+10FFFF (F4).
 */
bool isValidSecondByte(unsigned char lead, unsigned char c) noexcept {
    switch (lead) {
    case 0xE0: return c >= 0xA0 && c <= 0xBF;
    case 0xED: return c >= 0x80 && c <= 0x9F;
    case 0xF0: return c >= 0x90 && c <= 0xBF;
    case 0xF4: return c >= 0x80 && c <= 0x8F;
    default: return isContinuation(c);
    }
}

/// Длина последовательности по ведущему байту, 0: недопустимый ведущий байт
size_t sequenceLength(unsigned char lead) noexcept {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

} // namespace

std::optional<model::Utf8Error> validateUtf8(std::string_view input) noexcept {
    size_t i = 0;
    while (i < input.size()) {
        unsigned char lead = static_cast<unsigned char>(input[i]);
        size_t length = sequenceLength(lead);

        if (length == 0) {
            return model::Utf8Error{i, 1};
        }
        if (length == 1) {
            ++i;
            continue;
        }

        // Проверяем байты продолжения по одному: ошибка на k-м байте даёт error_len = k
        for (size_t k = 1; k < length; ++k) {
            if (i + k >= input.size()) {
                return model::Utf8Error{i, std::nullopt};
            }
            unsigned char c = static_cast<unsigned char>(input[i + k]);
            bool ok = (k == 1) ? isValidSecondByte(lead, c) : isContinuation(c);
            if (!ok) {
                return model::Utf8Error{i, k};
            }
        }
        i += length;
    }
    return std::nullopt;
}

std::string asciiToLower(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    for (char c : input) {
        out.push_back(toAsciiLower(c));
    }
    return out;
}

std::string asciiToUpper(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    for (char c : input) {
        out.push_back(toAsciiUpper(c));
    }
    return out;
}

} // namespace textnorm::core
