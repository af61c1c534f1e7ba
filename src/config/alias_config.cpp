/// @file src/config/alias_config.cpp
/// @brief AliasConfigLoader: alias JSON file I/O.

#include "vitalog/alias_config.hpp"
#include "vitalog/constants.hpp"

#include "../util/text.hpp"

#include <fmt/format.h>
#include <fmt/std.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace vitalog::config {

aliases::AliasMap AliasConfigLoader::empty_map() {
    aliases::AliasMap map;
    for (std::string_view category : constants::ALIAS_CATEGORIES) {
        map.emplace(std::string(category), aliases::CategoryMap{});
    }
    return map;
}

// ─── AliasConfigLoader::parse_json_string ─────────────────────────────────────

std::optional<aliases::AliasMap>
AliasConfigLoader::parse_json_string(std::string_view content) noexcept {
    try {
        const auto document = nlohmann::json::parse(content);
        if (!document.is_object()) {
            fmt::print(stderr, "[alias_config] Top level must be an object of categories\n");
            return std::nullopt;
        }

        aliases::AliasMap map = empty_map();
        for (const auto& [category, entries] : document.items()) {
            if (!entries.is_object()) {
                fmt::print(stderr, "[alias_config] Skipping category '{}': not an object\n",
                           category);
                continue;
            }

            auto& mapping = map[util::to_lower(category)];
            for (const auto& [abbreviation, canonical] : entries.items()) {
                if (!canonical.is_string()) {
                    fmt::print(stderr, "[alias_config] Skipping {}.{}: value is not a string\n",
                               category, abbreviation);
                    continue;
                }
                mapping[util::to_lower(abbreviation)] = canonical.get<std::string>();
            }
        }
        return map;
    } catch (const std::exception& e) {
        fmt::print(stderr, "[alias_config] Error parsing alias JSON: {}\n", e.what());
        return std::nullopt;
    }
}

// ─── AliasConfigLoader::load_file ─────────────────────────────────────────────

std::optional<aliases::AliasMap>
AliasConfigLoader::load_file(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            fmt::print(stderr, "[alias_config] Cannot open {}\n", path);
            return std::nullopt;
        }

        std::ostringstream contents;
        contents << file.rdbuf();
        return parse_json_string(contents.str());
    } catch (const std::exception& e) {
        fmt::print(stderr, "[alias_config] Error reading {}: {}\n", path, e.what());
        return std::nullopt;
    }
}

// ─── AliasConfigLoader::save_file ─────────────────────────────────────────────

bool AliasConfigLoader::save_file(const std::filesystem::path& path,
                                  const aliases::AliasMap& map) noexcept {
    try {
        nlohmann::json document = nlohmann::json::object();
        for (const auto& [category, mapping] : map) {
            auto& entries = document[category];
            entries = nlohmann::json::object();
            for (const auto& [abbreviation, canonical] : mapping) {
                entries[abbreviation] = canonical;
            }
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            fmt::print(stderr, "[alias_config] Cannot write {}\n", path);
            return false;
        }
        file << document.dump(2) << '\n';
        return static_cast<bool>(file);
    } catch (const std::exception& e) {
        fmt::print(stderr, "[alias_config] Error writing {}: {}\n", path, e.what());
        return false;
    }
}

} // namespace vitalog::config
