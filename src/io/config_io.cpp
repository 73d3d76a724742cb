/**
 * @file config_io.cpp
 * @brief Чтение и запись настроек нормализации путей
 */

#include "config_io.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>
#include <system_error>

namespace textnorm::io {

using json = nlohmann::json;

namespace {

void readFlag(const json& j, const char* key, bool& target) {
    if (!j.contains(key)) {
        return;
    }
    const auto& value = j.at(key);
    if (!value.is_boolean()) {
        throw ConfigError(std::string("Параметр \"") + key + "\" должен быть true или false");
    }
    target = value.get<bool>();
}

std::string readConfigText(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw ConfigError("Не удалось открыть файл настроек: " + path.string());
    }
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

/// Запись через соседний `.tmp` с последующим rename
void replaceConfigFile(const std::filesystem::path& path, const std::string& text) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw ConfigError("Не удалось создать каталог " + path.parent_path().string() + ": " + ec.message());
        }
    }

    auto staging = path;
    staging += ".tmp";
    {
        std::ofstream ofs(staging, std::ios::binary | std::ios::trunc);
        ofs << text << '\n';
        if (!ofs.flush()) {
            std::filesystem::remove(staging, ec);
            throw ConfigError("Ошибка записи файла настроек: " + staging.string());
        }
    }

    std::filesystem::rename(staging, path, ec);
    if (ec) {
        std::filesystem::remove(staging, ec);
        throw ConfigError("Не удалось заменить файл настроек " + path.string());
    }
}

PathFormatConfig configFromJsonInternal(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Настройки должны быть JSON-объектом");
    }

    PathFormatConfig config;
    readFlag(j, "strip_ansi", config.strip_ansi);
    readFlag(j, "strip_unfriendly_chars", config.strip_unfriendly_chars);
    readFlag(j, "resolve_parent_dirs", config.resolve_parent_dirs);
    readFlag(j, "collapse_consecutive_slashes", config.collapse_consecutive_slashes);
    readFlag(j, "escape_backslashes", config.escape_backslashes);
    return config;
}

} // namespace

PathFormatConfig pathFormatConfigFromJson(const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw ConfigError("Ошибка парсинга JSON: " + std::string(e.what()));
    }
    return configFromJsonInternal(j);
}

std::string pathFormatConfigToJson(const PathFormatConfig& config, int indent) {
    json j;
    j["strip_ansi"] = config.strip_ansi;
    j["strip_unfriendly_chars"] = config.strip_unfriendly_chars;
    j["resolve_parent_dirs"] = config.resolve_parent_dirs;
    j["collapse_consecutive_slashes"] = config.collapse_consecutive_slashes;
    j["escape_backslashes"] = config.escape_backslashes;
    return j.dump(indent);
}

PathFormatConfig loadPathFormatConfig(const std::filesystem::path& path) {
    return pathFormatConfigFromJson(readConfigText(path));
}

void savePathFormatConfig(const PathFormatConfig& config, const std::filesystem::path& path) {
    replaceConfigFile(path, pathFormatConfigToJson(config));
}

} // namespace textnorm::io
