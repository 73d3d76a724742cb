/**
 * @file path_format.cpp
 * @brief Нормализация строк путей
 */

#include "path_format.hpp"
#include "ansi_strip.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <vector>

namespace textnorm::core {

namespace {

std::string collapseSlashes(std::string_view path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        if (c == '/' && !out.empty() && out.back() == '/') {
            continue;
        }
        out.push_back(c);
    }
    return out;
}

void removeUnfriendlyChars(std::string& path) {
    std::erase_if(path, [](char c) {
        return kUnfriendlyChars.find(c) != std::string_view::npos;
    });
}

bool endsWithSlash(std::string_view s) noexcept {
    return !s.empty() && s.back() == '/';
}

} // namespace

std::string resolveDotComponents(std::string_view path) {
    bool rooted = !path.empty() && path.front() == '/';
    std::vector<std::string_view> stack;

    size_t pos = 0;
    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        if (next == std::string_view::npos) {
            next = path.size();
        }
        std::string_view component = path.substr(pos, next - pos);
        pos = next + 1;

        if (component.empty() || component == ".") {
            continue;
        }
        if (component == "..") {
            // Подъём выше начала строки не выполняется
            if (!stack.empty()) {
                stack.pop_back();
            }
            continue;
        }
        stack.push_back(component);
    }

    std::string out;
    if (rooted) {
        out.push_back('/');
    }
    for (size_t i = 0; i < stack.size(); ++i) {
        if (i > 0) {
            out.push_back('/');
        }
        out.append(stack[i]);
    }

    if (out.empty()) {
        out = ".";
    }
    return out;
}

PathFormatResult formatPathString(std::string_view path) {
    return formatPathString(path, PathFormatConfig{});
}

PathFormatResult formatPathString(std::string_view path, const PathFormatConfig& config) {
    PathFormatResult result;
    const bool ends_with_slash = endsWithSlash(path);

    std::string current(path);

#if defined(TEXTNORM_HAS_ANSI_STRIP) && TEXTNORM_HAS_ANSI_STRIP
    if (config.strip_ansi) {
        if (containsEscape(current)) {
            current = stripAnsiEscapes(current);
        }
        if (auto utf8_error = validateUtf8(current)) {
            result.error = model::PathFormatError{model::PathFormatErrorKind::InvalidText, *utf8_error};
            return result;
        }
    }
#endif

    if (config.escape_backslashes) {
        std::replace(current.begin(), current.end(), '\\', '/');
    }

    if (config.collapse_consecutive_slashes) {
        current = collapseSlashes(current);
    }

    if (config.strip_unfriendly_chars) {
        removeUnfriendlyChars(current);
    }

    if (config.resolve_parent_dirs) {
        current = resolveDotComponents(current);
    }

    if (ends_with_slash && !endsWithSlash(current)) {
        current.push_back('/');
    }

    if (current == "./") {
        current.clear();
    }

    result.success = true;
    result.path = std::move(current);
    return result;
}

FsPathFormatResult formatPath(const std::filesystem::path& path) {
    return formatPath(path, PathFormatConfig{});
}

FsPathFormatResult formatPath(const std::filesystem::path& path, const PathFormatConfig& config) {
    FsPathFormatResult result;
    auto formatted = formatPathString(path.string(), config);
    if (!formatted) {
        result.error = formatted.error;
        return result;
    }
    result.success = true;
    result.path = std::filesystem::path(formatted.path);
    return result;
}

} // namespace textnorm::core
