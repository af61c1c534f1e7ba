#pragma once

/// @file src/parser/field_parsers.hpp
/// @brief Kind-specific field parsers used by EntryParser.
///
/// # Module: Field Parsers
///
/// ## Responsibility
/// Turn the token stream that follows the kind keyword into one record.
/// EntryParser has already stripped directives and chosen the kind; these
/// functions own everything after that point.
///
/// ## Silent Skips vs Failures
/// Tokens that are simply not recognized (an RPE of 15, a word that is not a
/// condition) are skipped. Tokens that are recognized but invalid (a
/// technique on a heart-rate entry, `cp 900`) throw. The two paths stay
/// separate branches of each scan.
///
/// ## NOT Responsible For
/// - Directive extraction (see vitalog/directives.hpp)
/// - Kind dispatch (see vitalog/parser.hpp)

#include "vitalog/aliases.hpp"
#include "vitalog/entry.hpp"
#include "vitalog/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vitalog::parser::detail {

/// What every field parser receives besides its tokens.
struct FieldContext {
    Timestamp                  timestamp;
    Tags                       tags;
    const aliases::AliasTable& table;  ///< Alias snapshot for this parse
};

// ─── Token patterns ───────────────────────────────────────────────────────────

/// `\d+(\.\d+)?`: an unsigned decimal.
[[nodiscard]] bool is_decimal(std::string_view token) noexcept;

/// Weight token `\d+(\.\d+)?(kg)?`; its numeric value, or `nullopt`.
[[nodiscard]] std::optional<double> match_weight(std::string_view token);

/// Reps token: `NxM`, `a,b,c`, or a bare integer.
[[nodiscard]] bool is_reps_pattern(std::string_view token) noexcept;

/// Expand a reps token: `3x5` → {5,5,5}, `8,6,4` → {8,6,4}, `10` → {10}.
///
/// # Throws
/// - RepsParseError if the token yields no sets or a zero rep count
/// - `std::invalid_argument` if a number overflows `int`
[[nodiscard]] std::vector<int> parse_reps(std::string_view token);

/// RPE token `(rpe)?\d+(\.\d+)?` with value in [RPE_MIN, RPE_MAX];
/// `nullopt` otherwise (out of range is not an error).
[[nodiscard]] std::optional<double> match_rpe(std::string_view token);

/// Body-fat token `\d+(\.\d+)?%?`; its value, or `nullopt`.
[[nodiscard]] std::optional<double> match_bodyfat(std::string_view token);

// ─── Numeric conversion ───────────────────────────────────────────────────────

/// Whole-token integer conversion.
///
/// # Throws
/// `std::invalid_argument` naming `field` if `token` is not an integer.
[[nodiscard]] int to_int(std::string_view token, std::string_view field);

/// Whole-token finite floating-point conversion.
///
/// # Throws
/// `std::invalid_argument` naming `field` if `token` is not a finite number.
[[nodiscard]] double to_double(std::string_view token, std::string_view field);

// ─── Field parsers ────────────────────────────────────────────────────────────

/// `name [weight] reps [rpe]`. `tokens[0]` is the exercise name.
[[nodiscard]] entry::Exercise parse_exercise(std::span<const std::string> tokens,
                                             const FieldContext& ctx);

/// `BPM [conditions...]`
[[nodiscard]] entry::HeartRate parse_heart_rate(std::span<const std::string> tokens,
                                                const FieldContext& ctx);

/// `MS [rmssd|sdnn] [conditions...]`
[[nodiscard]] entry::Hrv parse_hrv(std::span<const std::string> tokens,
                                   const FieldContext& ctx);

/// `CELSIUS [conditions...]`: technique allowed.
[[nodiscard]] entry::Temperature parse_temperature(std::span<const std::string> tokens,
                                                   const FieldContext& ctx);

/// `KG [bodyfat[%]]`
[[nodiscard]] entry::Bodyweight parse_bodyweight(std::span<const std::string> tokens,
                                                 const FieldContext& ctx);

/// `SECONDS[s] [conditions...]`
[[nodiscard]] entry::ControlPause parse_control_pause(std::span<const std::string> tokens,
                                                      const FieldContext& ctx);

} // namespace vitalog::parser::detail
