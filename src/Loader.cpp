/**
 * @file Loader.cpp
 * @brief Settings file loading implementation
 */

#include "catrec/Loader.hpp"
#include "catrec/Errors.hpp"
#include "catrec/Util.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace catrec {

namespace {

// "log.level" -> {"log", "level"}
std::pair<std::string, std::string> split_key(const std::string& key) {
    const auto dot = key.find('.');
    return {key.substr(0, dot), key.substr(dot + 1)};
}

SettingsLayer read_json(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw FileNotFoundError(path);
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw SettingsError(path, e.what());
    }
    if (!doc.is_object()) {
        throw SettingsError(path, "top level must be an object");
    }

    SettingsLayer layer;
    for (const auto& key : settings_keys()) {
        const auto [section, name] = split_key(key);
        auto table = doc.find(section);
        if (table == doc.end()) continue;
        if (!table->is_object()) {
            throw SettingsError(section, "expected a table, got " + std::string(table->type_name()));
        }
        auto value = table->find(name);
        if (value == table->end()) continue;
        if (!value->is_string()) {
            throw SettingsError(key, "expected a string, got " + std::string(value->type_name()));
        }
        layer[key] = value->get<std::string>();
    }
    return layer;
}

SettingsLayer read_toml(const std::string& path) {
    toml::table doc;
    try {
        doc = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        std::ostringstream details;
        details << e.description() << " (line " << e.source().begin.line
                << ", column " << e.source().begin.column << ")";
        throw SettingsError(path, details.str());
    }

    SettingsLayer layer;
    for (const auto& key : settings_keys()) {
        const auto [section, name] = split_key(key);
        toml::node_view<toml::node> table = doc[section];
        if (!table) continue;
        if (!table.is_table()) {
            throw SettingsError(section, "expected a table");
        }
        toml::node_view<toml::node> value = table[name];
        if (!value) continue;
        const auto* text = value.as_string();
        if (!text) {
            throw SettingsError(key, "expected a string");
        }
        layer[key] = text->get();
    }
    return layer;
}

} // anonymous namespace

SettingsLayer load_settings_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = to_lower(fs::path(path).extension().string());
    if (ext == ".json") {
        return read_json(path);
    }
    if (ext == ".toml") {
        return read_toml(path);
    }
    throw SettingsError(path, "unsupported file type '" + ext + "' (expected .json or .toml)");
}

} // namespace catrec
