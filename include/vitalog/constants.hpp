#pragma once

#include <string_view>

/// @file include/vitalog/constants.hpp
/// @brief Parsing bounds, defaults, and alias category names.

namespace vitalog::constants {

// ─── Exercise ─────────────────────────────────────────────────────────────────

/// Inclusive RPE bounds. Tokens outside are ignored, not rejected.
static constexpr double RPE_MIN = 1.0;
static constexpr double RPE_MAX = 10.0;

/// Largest set count an `NxM` reps token may expand to.
static constexpr int MAX_SETS = 100;

// ─── Control Pause ────────────────────────────────────────────────────────────

/// Control-pause seconds must lie strictly inside (0, CONTROL_PAUSE_LIMIT).
static constexpr int CONTROL_PAUSE_LIMIT = 600;

// ─── HRV ──────────────────────────────────────────────────────────────────────

/// Metric assumed when an HRV entry names none.
static constexpr std::string_view DEFAULT_HRV_METRIC = "rmssd";

// ─── Alias Categories ─────────────────────────────────────────────────────────

static constexpr std::string_view ALIAS_EXERCISES   = "exercises";
static constexpr std::string_view ALIAS_HRV_METRICS = "hrv_metrics";
static constexpr std::string_view ALIAS_CONDITIONS  = "conditions";
static constexpr std::string_view ALIAS_TAGS        = "tags";

/// Every category the alias configuration is expected to carry.
static constexpr std::string_view ALIAS_CATEGORIES[] = {
    ALIAS_EXERCISES, ALIAS_HRV_METRICS, ALIAS_CONDITIONS, ALIAS_TAGS,
};

} // namespace vitalog::constants
