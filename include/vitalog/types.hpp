#pragma once

/// @file include/vitalog/types.hpp
/// @brief Shared primitive types for the vitalog entry parser.
///
/// Every vitalog module includes this file. It defines the closed set of
/// entry kinds, the timestamp representation, and the tag list type.

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vitalog {

// ─── Entry Kind ───────────────────────────────────────────────────────────────

/// Closed category of a logged observation. Fixed once an entry is parsed.
enum class EntryKind {
    Exercise,
    HeartRate,
    Hrv,
    Temperature,
    Bodyweight,
    ControlPause,
};

/// Storage tag of a kind: "exercise", "hr", "hrv", "temp", "weight", "cp".
[[nodiscard]] std::string_view to_string(EntryKind kind) noexcept;

/// Inverse of to_string(). Returns `nullopt` for an unknown tag.
[[nodiscard]] std::optional<EntryKind> entry_kind_from_string(std::string_view tag) noexcept;

// ─── Timestamp ────────────────────────────────────────────────────────────────

/// Second-precision wall-clock time. No time zone is attached: the value
/// reads the same as the clock on the user's wall.
using Timestamp = std::chrono::sys_seconds;

/// Current local wall-clock time, truncated to seconds.
[[nodiscard]] Timestamp local_now();

/// Format as `YYYY-MM-DDTHH:MM:SS`.
[[nodiscard]] std::string format_iso8601(Timestamp ts);

/// Parse `YYYY-MM-DDTHH:MM:SS` (a space separator and a missing time part
/// are accepted).
///
/// # Throws
/// `std::invalid_argument` on malformed text or an impossible date/time.
[[nodiscard]] Timestamp parse_iso8601(std::string_view text);

/// Build a timestamp from calendar fields.
///
/// # Throws
/// `std::invalid_argument` if the date does not exist or the time of day is
/// out of range.
[[nodiscard]] Timestamp make_timestamp(int year, unsigned month, unsigned day,
                                       int hour = 0, int minute = 0, int second = 0);

// ─── Tags ─────────────────────────────────────────────────────────────────────

/// Normalized, duplicate-free tag list in first-seen order.
/// `nullopt` means no tag directive was present at all.
using Tags = std::optional<std::vector<std::string>>;

} // namespace vitalog
