#pragma once

/// @file include/vitalog/alias_config.hpp
/// @brief JSON alias configuration loader.
///
/// # Module: AliasConfigLoader
///
/// ## Responsibility
/// Read and write the alias file that feeds aliases::AliasResolver. The
/// parsing core never touches the file system; this loader is the only
/// component that does.
///
/// ## Expected Format
/// ```json
/// {
///   "exercises":   { "sq": "squat", "bp": "bench press" },
///   "hrv_metrics": { "r": "rmssd" },
///   "conditions":  { "rest": "resting", "pp": "postprandial" },
///   "tags":        { "fitbit": "oura" }
/// }
/// ```
/// Keys are lowercased on load. Categories beyond the four standard ones are
/// kept; missing standard categories are created empty.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` / `false` on failure
/// - Skips individual malformed entries with a warning rather than failing
///   the whole load
/// - Diagnostics go to stderr

#include "vitalog/aliases.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace vitalog::config {

class AliasConfigLoader {
public:
    /// Load an alias file.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened or is not a JSON object
    /// - the mapping otherwise, with every standard category present
    [[nodiscard]] static std::optional<aliases::AliasMap>
    load_file(const std::filesystem::path& path) noexcept;

    /// Parse alias JSON held in memory (useful for testing).
    [[nodiscard]] static std::optional<aliases::AliasMap>
    parse_json_string(std::string_view content) noexcept;

    /// Write `map` as pretty-printed JSON with a trailing newline.
    ///
    /// # Returns
    /// `false` if the file cannot be written.
    [[nodiscard]] static bool save_file(const std::filesystem::path& path,
                                        const aliases::AliasMap& map) noexcept;

    /// A map holding every standard category, all empty.
    [[nodiscard]] static aliases::AliasMap empty_map();
};

} // namespace vitalog::config
