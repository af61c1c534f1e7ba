#pragma once

/// @file include/vitalog/entry.hpp
/// @brief Parsed entry model: one record type per entry kind.
///
/// # Module: Parsed Entry
///
/// ## Responsibility
/// Hold the typed result of a parse. `ParsedEntry` is a closed
/// `std::variant`; every consumer matches it exhaustively with `std::visit`,
/// so adding a kind is a compile error at each site until it is handled.
///
/// ## Display Layouts
/// ```
/// squat 100kg [5,5,5] RPE 8 @gym
/// pullups (BW) [10,10,10]
/// HR 58 bpm (resting, postprandial) @oura
/// HRV 45ms (rmssd) (morning)
/// Temp 37.2°C (postprandial, oral)
/// Weight 82.5kg (18% BF)
/// CP 45s (morning)
/// ```
///
/// ## Export Form
/// A JSON object with a `type` discriminator (`exercise`, `hr`, `hrv`,
/// `temp`, `weight`, `cp`), every kind-specific field, an ISO-8601
/// `timestamp`, and `tags`. Absent optionals, tags included, are written as
/// `null` rather than omitted. `from_json` reverses `to_json`.

#include "vitalog/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace vitalog::entry {

// ─── Records ──────────────────────────────────────────────────────────────────

struct Exercise {
    std::string           name;       ///< Alias-resolved exercise name
    std::optional<double> weight_kg;  ///< `nullopt` for bodyweight work
    std::vector<int>      reps;       ///< One element per set
    std::optional<double> rpe;        ///< In [1, 10] when present
    Timestamp             timestamp;
    Tags                  tags;
};

struct HeartRate {
    int                        bpm;
    std::optional<std::string> conditions;
    Timestamp                  timestamp;
    Tags                       tags;
};

struct Hrv {
    double                     ms;
    std::string                metric;  ///< "rmssd" unless named
    std::optional<std::string> conditions;
    Timestamp                  timestamp;
    Tags                       tags;
};

struct Temperature {
    double                     celsius;
    std::optional<std::string> conditions;  ///< May include a technique
    Timestamp                  timestamp;
    Tags                       tags;
};

struct Bodyweight {
    double                kg;
    std::optional<double> bodyfat_pct;
    Timestamp             timestamp;
    Tags                  tags;
};

struct ControlPause {
    int                        seconds;  ///< In (0, 600)
    std::optional<std::string> conditions;
    Timestamp                  timestamp;
    Tags                       tags;
};

using ParsedEntry =
    std::variant<Exercise, HeartRate, Hrv, Temperature, Bodyweight, ControlPause>;

// ─── Visitation helper ────────────────────────────────────────────────────────

/// Overload set for exhaustive `std::visit`.
template <class... Fs>
struct Overloaded : Fs... {
    using Fs::operator()...;
};
template <class... Fs>
Overloaded(Fs...) -> Overloaded<Fs...>;

// ─── Accessors ────────────────────────────────────────────────────────────────

[[nodiscard]] EntryKind kind_of(const ParsedEntry& entry) noexcept;
[[nodiscard]] Timestamp timestamp_of(const ParsedEntry& entry) noexcept;
[[nodiscard]] const Tags& tags_of(const ParsedEntry& entry) noexcept;

/// Conditions of the entry; `nullopt` for kinds without a conditions field.
[[nodiscard]] std::optional<std::string> conditions_of(const ParsedEntry& entry);

// ─── Display ──────────────────────────────────────────────────────────────────

/// Canonical single-line rendering, tags appended as ` @tag`.
[[nodiscard]] std::string display(const ParsedEntry& entry);

/// Shortest decimal form that round-trips: 100.0 → "100", 37.2 → "37.2".
[[nodiscard]] std::string format_number(double value);

// ─── Export / Import ──────────────────────────────────────────────────────────

/// Structured export form (see file comment).
[[nodiscard]] nlohmann::json to_json(const ParsedEntry& entry);

/// Rebuild an entry from its export form. Stored condition strings are
/// re-validated against the entry kind.
///
/// # Throws
/// - `std::invalid_argument` for an unknown `type`, a missing or mistyped
///   field, or a malformed timestamp
/// - InapplicableConditionError / ConditionConflictError for a stored
///   condition string that is no longer valid
[[nodiscard]] ParsedEntry from_json(const nlohmann::json& document);

} // namespace vitalog::entry
