#pragma once

/// @file include/vitalog/conditions.hpp
/// @brief Condition dimensions and the ConditionResolver.
///
/// # Module: Conditions
///
/// ## Responsibility
/// A condition qualifies a measurement ("resting", "postprandial", "oral").
/// Each condition value belongs to exactly one *dimension*, an axis of
/// mutually exclusive values:
///
/// | priority | dimension   | values                                 |
/// |---------:|-------------|----------------------------------------|
/// | 1        | activity    | waking, resting, active, post-workout  |
/// | 2        | time_of_day | morning, evening                       |
/// | 3        | metabolic   | postprandial, fasted                   |
/// | 4        | emotional   | stressed, relaxed                      |
/// | 5        | technique   | oral, underarm, forehead_ir, ear       |
///
/// Dimensions apply to heart-rate, HRV, temperature and control-pause
/// entries, except `technique`, which applies to temperature only. Exercise
/// and bodyweight entries carry no conditions.
///
/// ## Condition String
/// The canonical encoding of an entry's conditions: values in ascending
/// dimension priority, joined by `,`, one value per dimension at most.
/// "No conditions" is `std::nullopt`, never an empty string.
///
/// ## Guarantees
/// - `resolve` output depends only on the set of values, not on token order
/// - Unrecognized tokens are skipped; recognized-but-invalid values throw

#include "vitalog/aliases.hpp"
#include "vitalog/types.hpp"

#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vitalog::conditions {

// ─── Dimension ────────────────────────────────────────────────────────────────

/// A named axis of mutually exclusive condition values.
struct Dimension {
    std::string                     name;
    int                             priority;  ///< Unique; lower sorts first
    std::set<std::string, std::less<>> values;
    std::set<EntryKind>             applicable_kinds;

    [[nodiscard]] bool applies_to(EntryKind kind) const noexcept {
        return applicable_kinds.contains(kind);
    }
};

// ─── Dimension Registry ───────────────────────────────────────────────────────

/// The full catalog, ascending priority.
[[nodiscard]] const std::vector<Dimension>& all_dimensions() noexcept;

/// Dimensions usable by `kind`, ascending priority. Empty for exercise and
/// bodyweight.
[[nodiscard]] std::vector<Dimension> applicable_dimensions(EntryKind kind);

/// Union of the values of every dimension usable by `kind`.
[[nodiscard]] std::set<std::string> applicable_values(EntryKind kind);

/// The dimension that owns `value`, or `nullptr` if `value` is not a
/// condition. Points into the static catalog.
[[nodiscard]] const Dimension* dimension_of(std::string_view value) noexcept;

/// Dimension by name, or `nullptr`.
[[nodiscard]] const Dimension* find_dimension(std::string_view name) noexcept;

/// True for the kinds that carry a conditions field.
[[nodiscard]] bool supports_conditions(EntryKind kind) noexcept;

// ─── ConditionResolver ────────────────────────────────────────────────────────

/// Turns loose tokens into canonical condition strings and re-checks stored
/// ones. Stateless.
class ConditionResolver {
public:
    ConditionResolver() = delete;

    /// Resolve candidate tokens into a condition string for `kind`.
    ///
    /// Each token is first mapped through `alias_map` (identity on a miss).
    /// Tokens that are still not condition values are skipped; they may
    /// belong to another sub-parser.
    ///
    /// # Returns
    /// - `nullopt` if no token named a condition
    /// - values ordered by dimension priority, comma-joined
    ///
    /// # Throws
    /// - InapplicableConditionError if a value's dimension does not apply to `kind`
    /// - ConditionConflictError if two values share a dimension
    [[nodiscard]] static std::optional<std::string>
    resolve(std::span<const std::string> tokens,
            EntryKind kind,
            const aliases::CategoryMap& alias_map);

    /// Re-check a stored condition string against `kind`. `nullopt` is valid.
    ///
    /// # Throws
    /// - InapplicableConditionError for an unknown value (no dimension) or
    ///   a value whose dimension does not apply
    /// - ConditionConflictError if two values share a dimension
    static void validate(const std::optional<std::string>& conditions, EntryKind kind);

    /// Display form: `"resting,postprandial"` → `"(resting, postprandial)"`.
    /// Empty string for `nullopt` or `""`.
    [[nodiscard]] static std::string format(const std::optional<std::string>& conditions);
};

} // namespace vitalog::conditions
