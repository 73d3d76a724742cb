/**
 * @file cli_commands.cpp
 * @brief Команды CLI `textnorm case` и `textnorm path`
 */

#include "cli_commands.hpp"
#include "core/case_formatter.hpp"
#include "core/path_format.hpp"
#include "io/config_io.hpp"
#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>
#include <string_view>

namespace textnorm::app {

namespace {

using textnorm::model::CaseStyle;
using textnorm::model::PathFormatConfig;

void printCaseUsage(std::ostream& err) {
    err << "usage:\n"
        << "  textnorm case <style> <text>...\n"
        << "  textnorm case --all <text>...\n"
        << "\n"
        << "styles: camel, pascal, kebab, snake, dot, title, lower, upper\n";
}

void printPathUsage(std::ostream& err) {
    err << "usage:\n"
        << "  textnorm path [options] <path>...\n"
        << "\n"
        << "options:\n"
        << "  --config <file>              JSON с настройками нормализации\n"
        << "  --no-strip-ansi              не удалять ANSI escape-последовательности\n"
        << "  --no-strip-chars             не удалять символы * ? \" < > |\n"
        << "  --no-resolve-parents         не разрешать . и ..\n"
        << "  --no-collapse-slashes        не схлопывать повторяющиеся /\n"
        << "  --no-backslashes             не заменять \\ на /\n"
        << "  --stdin                      читать пути построчно из stdin\n"
        << "  --dump-config                вывести итоговые настройки в JSON\n";
}

bool normalizeOne(const std::string& path, const PathFormatConfig& config, CommandStreams streams) {
    auto result = core::formatPathString(path, config);
    if (!result) {
        streams.err << "Ошибка нормализации пути: " << result.error->message() << std::endl;
        return false;
    }
    streams.out << result.path << "\n";
    return true;
}

} // namespace

int runCaseCommand(const std::vector<std::string>& args, CommandStreams streams) {
    if (args.size() < 2) {
        printCaseUsage(streams.err);
        return 1;
    }

    const std::string& selector = args.front();
    std::optional<CaseStyle> style;
    bool all_styles = (selector == "--all");
    if (!all_styles) {
        style = core::parseCaseStyle(selector);
        if (!style.has_value()) {
            streams.err << "Неизвестный стиль: " << selector << std::endl;
            printCaseUsage(streams.err);
            return 1;
        }
    }

    for (size_t i = 1; i < args.size(); ++i) {
        core::CaseFormatter formatter(args[i]);
        if (all_styles) {
            for (CaseStyle s : model::kAllCaseStyles) {
                streams.out << model::caseStyleToString(s) << ": " << formatter.format(s) << "\n";
            }
        } else {
            streams.out << formatter.format(*style) << "\n";
        }
    }
    return 0;
}

int runPathCommand(const std::vector<std::string>& args, CommandStreams streams) {
    std::optional<std::filesystem::path> config_path;
    std::vector<std::string> paths;
    bool read_stdin = false;
    bool dump_config = false;

    bool no_strip_ansi = false;
    bool no_strip_chars = false;
    bool no_resolve = false;
    bool no_collapse = false;
    bool no_backslashes = false;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string_view arg(args[i]);
        if (arg == "--config") {
            if (i + 1 >= args.size()) {
                streams.err << "Опция --config требует путь к файлу" << std::endl;
                printPathUsage(streams.err);
                return 1;
            }
            config_path = std::filesystem::path(args[++i]);
        } else if (arg == "--no-strip-ansi") {
            no_strip_ansi = true;
        } else if (arg == "--no-strip-chars") {
            no_strip_chars = true;
        } else if (arg == "--no-resolve-parents") {
            no_resolve = true;
        } else if (arg == "--no-collapse-slashes") {
            no_collapse = true;
        } else if (arg == "--no-backslashes") {
            no_backslashes = true;
        } else if (arg == "--stdin") {
            read_stdin = true;
        } else if (arg == "--dump-config") {
            dump_config = true;
        } else if (arg == "--") {
            paths.insert(paths.end(), args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
            break;
        } else if (arg.starts_with("--")) {
            streams.err << "Неизвестная опция: " << arg << std::endl;
            printPathUsage(streams.err);
            return 1;
        } else {
            paths.push_back(args[i]);
        }
    }

    if (paths.empty() && !read_stdin && !dump_config) {
        printPathUsage(streams.err);
        return 1;
    }

    PathFormatConfig config;
    if (config_path.has_value()) {
        try {
            config = io::loadPathFormatConfig(*config_path);
        } catch (const io::ConfigError& e) {
            streams.err << "Ошибка чтения настроек: " << e.what() << std::endl;
            return 1;
        }
    }
    if (no_strip_ansi) config.strip_ansi = false;
    if (no_strip_chars) config.strip_unfriendly_chars = false;
    if (no_resolve) config.resolve_parent_dirs = false;
    if (no_collapse) config.collapse_consecutive_slashes = false;
    if (no_backslashes) config.escape_backslashes = false;

    if (dump_config) {
        streams.out << io::pathFormatConfigToJson(config) << "\n";
    }

    bool all_ok = true;
    for (const auto& path : paths) {
        all_ok = normalizeOne(path, config, streams) && all_ok;
    }

    if (read_stdin) {
        std::string line;
        while (std::getline(streams.in, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            all_ok = normalizeOne(line, config, streams) && all_ok;
        }
    }

    return all_ok ? 0 : 1;
}

} // namespace textnorm::app
