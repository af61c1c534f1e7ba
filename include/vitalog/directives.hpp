#pragma once

/// @file include/vitalog/directives.hpp
/// @brief Timestamp and tag directive extraction.
///
/// # Module: Directives
///
/// ## Responsibility
/// Strip `@` directives out of a raw entry before kind dispatch:
///
/// | directive      | meaning                                   |
/// |----------------|-------------------------------------------|
/// | `@HH:MM`       | that time on the reference date           |
/// | `@yesterday`   | midnight of the day before the reference  |
/// | `@YYYY-MM-DD`  | that date, midnight                       |
/// | `@word`        | tag (letter first, then `[a-z0-9_-]`)     |
///
/// The timestamp directive is extracted first and only once; tags are then
/// read from the already timestamp-stripped text, so `@14:30` can never be
/// taken for a tag and `@oura` can never be taken for a time.
///
/// ## Guarantees
/// - Directive position in the text does not matter
/// - Tags are lowercased, alias-resolved and deduplicated (first one wins)
/// - No tags → `nullopt`, never an empty list

#include "vitalog/aliases.hpp"
#include "vitalog/types.hpp"

#include <string>
#include <string_view>

namespace vitalog::directives {

/// Result of extract_timestamp().
struct TimestampExtraction {
    Timestamp   timestamp;  ///< Directive value, or the reference when absent
    std::string text;       ///< Input with the directive removed, trimmed
    bool        matched;    ///< True if a directive was consumed
};

/// Result of extract_tags().
struct TagExtraction {
    Tags        tags;  ///< `nullopt` when no tag directive was present
    std::string text;  ///< Input without tags, whitespace collapsed
};

/// Result of extract().
struct Directives {
    Timestamp   timestamp;
    Tags        tags;
    std::string remainder;  ///< Lowercased text left for kind dispatch
};

/// Find and remove the first timestamp directive, trying `@HH:MM`, then
/// `@yesterday`, then `@YYYY-MM-DD`.
///
/// # Throws
/// `std::invalid_argument` if the matched directive names an impossible
/// time or date (`@25:00`, `@2026-02-30`).
[[nodiscard]] TimestampExtraction extract_timestamp(std::string_view text,
                                                    Timestamp reference);

/// Find and remove every tag directive. `@yesterday` is a timestamp word and
/// is never read as a tag.
[[nodiscard]] TagExtraction extract_tags(std::string_view text,
                                         const aliases::CategoryMap& tag_aliases);

/// Lowercase and trim `raw`, then extract the timestamp and the tags.
[[nodiscard]] Directives extract(std::string_view raw,
                                 Timestamp reference,
                                 const aliases::CategoryMap& tag_aliases);

} // namespace vitalog::directives
