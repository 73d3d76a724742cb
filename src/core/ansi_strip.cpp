/**
 * @file ansi_strip.cpp
 * @brief Удаление управляющих escape-последовательностей терминала
 */

#include "ansi_strip.hpp"

namespace textnorm::core {

namespace {

constexpr char kEsc = '\x1b';
constexpr char kBel = '\x07';
constexpr size_t kMalformed = std::string_view::npos;

bool inRange(char c, unsigned char lo, unsigned char hi) noexcept {
    auto u = static_cast<unsigned char>(c);
    return u >= lo && u <= hi;
}

/// Строка до ST (`ESC \`) или, если разрешено, до BEL
size_t skipUntilTerminator(std::string_view input, size_t pos, bool allow_bel) noexcept {
    for (size_t j = pos; j < input.size(); ++j) {
        if (allow_bel && input[j] == kBel) {
            return j + 1;
        }
        if (input[j] == kEsc && j + 1 < input.size() && input[j + 1] == '\\') {
            return j + 2;
        }
    }
    return kMalformed;
}

/**
 * @brief Конец escape-последовательности, начинающейся с ESC в позиции pos
 * @return Индекс первого байта после последовательности или kMalformed
 */
size_t escapeSequenceEnd(std::string_view input, size_t pos) noexcept {
    if (pos + 1 >= input.size()) {
        return kMalformed;
    }

    char kind = input[pos + 1];
    switch (kind) {
    case '[': {
        size_t j = pos + 2;
        while (j < input.size() && inRange(input[j], 0x30, 0x3F)) ++j;
        while (j < input.size() && inRange(input[j], 0x20, 0x2F)) ++j;
        if (j < input.size() && inRange(input[j], 0x40, 0x7E)) {
            return j + 1;
        }
        return kMalformed;
    }
    case ']':
        return skipUntilTerminator(input, pos + 2, true);
    case 'P':
    case 'X':
    case '^':
    case '_':
        return skipUntilTerminator(input, pos + 2, false);
    default:
        break;
    }

    if (inRange(kind, 0x20, 0x2F)) {
        size_t j = pos + 1;
        while (j < input.size() && inRange(input[j], 0x20, 0x2F)) ++j;
        if (j < input.size() && inRange(input[j], 0x30, 0x7E)) {
            return j + 1;
        }
        return kMalformed;
    }

    // Fp/Fe/Fs: ESC 7, ESC 8, ESC c, ESC M и т.п.
    if (inRange(kind, 0x30, 0x7E)) {
        return pos + 2;
    }

    return kMalformed;
}

} // namespace

std::string stripAnsiEscapes(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        if (input[i] != kEsc) {
            out.push_back(input[i]);
            ++i;
            continue;
        }

        size_t end = escapeSequenceEnd(input, i);
        if (end == kMalformed) {
            out.push_back(input[i]);
            ++i;
        } else {
            i = end;
        }
    }

    return out;
}

bool containsEscape(std::string_view input) noexcept {
    return input.find(kEsc) != std::string_view::npos;
}

} // namespace textnorm::core
