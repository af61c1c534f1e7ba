#pragma once

/// @file include/vitalog/parser.hpp
/// @brief EntryParser: raw text → ParsedEntry.
///
/// # Module: Entry Parser
///
/// ## Pipeline
/// ```
/// raw text
///   → lowercase, trim
///   → timestamp directive   (@14:30, @yesterday, @2026-01-05)
///   → tag directives        (@oura @gym)
///   → first token picks the kind
///   → kind-specific field parser
///   → ParsedEntry
/// ```
///
/// ## Kind Keywords
/// | keyword        | kind         |
/// |----------------|--------------|
/// | `hr`           | HeartRate    |
/// | `hrv`          | Hrv          |
/// | `temp`         | Temperature  |
/// | `weight`, `bw` | Bodyweight   |
/// | `cp`, `pause`  | ControlPause |
/// | anything else  | Exercise (the token is the exercise name) |
///
/// ## Usage
/// ```cpp
/// aliases::AliasResolver aliases(initial_map);
/// parser::EntryParser parser(aliases);
/// auto entry = parser.parse("squat 100 3x5 @gym");
/// fmt::print("{}\n", entry::display(entry));   // squat 100kg [5,5,5] @gym
/// ```
///
/// ## Guarantees
/// - Pure: no I/O, no state besides the alias snapshot taken per call
/// - Safe to call concurrently with itself and with alias reloads
/// - Either returns a complete entry or throws (see vitalog/errors.hpp)

#include "vitalog/aliases.hpp"
#include "vitalog/entry.hpp"
#include "vitalog/types.hpp"

#include <optional>
#include <string_view>

namespace vitalog::parser {

class EntryParser {
public:
    /// The resolver must outlive the parser.
    explicit EntryParser(const aliases::AliasResolver& aliases) noexcept;

    /// Parse using the current local time as the reference timestamp.
    [[nodiscard]] entry::ParsedEntry parse(std::string_view text) const;

    /// Parse relative to `now`: entries without a timestamp directive are
    /// stamped `now`; `@HH:MM` and `@yesterday` are taken relative to it.
    ///
    /// # Throws
    /// - EmptyInputError if nothing remains after directives are stripped
    /// - MissingValueError if a metric keyword has no value
    /// - RepsParseError if an exercise has no reps, or more than
    ///   constants::MAX_SETS sets
    /// - InapplicableConditionError / ConditionConflictError
    /// - `std::invalid_argument` for malformed numbers or timestamps, or
    ///   text that is not valid UTF-8
    [[nodiscard]] entry::ParsedEntry parse(std::string_view text, Timestamp now) const;

    /// Kind selected by a metric keyword; `nullopt` means "exercise".
    [[nodiscard]] static std::optional<EntryKind> kind_for_keyword(std::string_view token) noexcept;

private:
    const aliases::AliasResolver& aliases_;
};

} // namespace vitalog::parser
