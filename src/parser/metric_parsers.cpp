/// @file src/parser/metric_parsers.cpp
/// @brief Heart-rate, HRV, temperature, bodyweight and control-pause fields.

#include "field_parsers.hpp"

#include "vitalog/conditions.hpp"
#include "vitalog/constants.hpp"
#include "vitalog/errors.hpp"

#include "../util/text.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace vitalog::parser::detail {

namespace {

using conditions::ConditionResolver;

/// First token, or MissingValueError with `message`.
const std::string& primary(std::span<const std::string> tokens,
                           EntryKind kind, const char* message) {
    if (tokens.empty()) {
        throw MissingValueError(kind, message);
    }
    return tokens.front();
}

std::optional<std::string> resolve_conditions(std::span<const std::string> tokens,
                                              EntryKind kind,
                                              const FieldContext& ctx) {
    return ConditionResolver::resolve(tokens, kind,
                                      ctx.table.category(constants::ALIAS_CONDITIONS));
}

} // anonymous namespace

// ─── Heart rate ───────────────────────────────────────────────────────────────

entry::HeartRate parse_heart_rate(std::span<const std::string> tokens, const FieldContext& ctx) {
    const auto& value = primary(tokens, EntryKind::HeartRate, "Heart rate needs BPM value");

    return entry::HeartRate{
        .bpm        = to_int(value, "BPM"),
        .conditions = resolve_conditions(tokens.subspan(1), EntryKind::HeartRate, ctx),
        .timestamp  = ctx.timestamp,
        .tags       = ctx.tags,
    };
}

// ─── HRV ──────────────────────────────────────────────────────────────────────

entry::Hrv parse_hrv(std::span<const std::string> tokens, const FieldContext& ctx) {
    const auto& value = primary(tokens, EntryKind::Hrv, "HRV needs milliseconds value");
    const double ms = to_double(value, "milliseconds");

    const auto& metric_aliases = ctx.table.category(constants::ALIAS_HRV_METRICS);
    std::string metric(constants::DEFAULT_HRV_METRIC);
    std::vector<std::string> condition_tokens;

    for (const auto& token : tokens.subspan(1)) {
        if (const auto alias = metric_aliases.find(token); alias != metric_aliases.end()) {
            metric = alias->second;
        } else if (token == "rmssd" || token == "sdnn") {
            metric = token;
        } else {
            condition_tokens.push_back(token);
        }
    }

    return entry::Hrv{
        .ms         = ms,
        .metric     = std::move(metric),
        .conditions = resolve_conditions(condition_tokens, EntryKind::Hrv, ctx),
        .timestamp  = ctx.timestamp,
        .tags       = ctx.tags,
    };
}

// ─── Temperature ──────────────────────────────────────────────────────────────

entry::Temperature parse_temperature(std::span<const std::string> tokens,
                                     const FieldContext& ctx) {
    const auto& value = primary(tokens, EntryKind::Temperature, "Temperature needs Celsius value");

    return entry::Temperature{
        .celsius    = to_double(value, "Celsius"),
        .conditions = resolve_conditions(tokens.subspan(1), EntryKind::Temperature, ctx),
        .timestamp  = ctx.timestamp,
        .tags       = ctx.tags,
    };
}

// ─── Bodyweight ───────────────────────────────────────────────────────────────

entry::Bodyweight parse_bodyweight(std::span<const std::string> tokens,
                                   const FieldContext& ctx) {
    const auto& value = primary(tokens, EntryKind::Bodyweight, "Bodyweight needs kg value");

    return entry::Bodyweight{
        .kg          = to_double(value, "kg"),
        .bodyfat_pct = tokens.size() > 1 ? match_bodyfat(tokens[1]) : std::nullopt,
        .timestamp   = ctx.timestamp,
        .tags        = ctx.tags,
    };
}

// ─── Control pause ────────────────────────────────────────────────────────────

entry::ControlPause parse_control_pause(std::span<const std::string> tokens,
                                        const FieldContext& ctx) {
    const auto& value = primary(tokens, EntryKind::ControlPause,
                                "Control pause needs seconds value");

    std::string_view digits = value;
    if (digits.ends_with('s')) {
        digits.remove_suffix(1);
    }
    if (!util::all_digits(digits)) {
        throw std::invalid_argument(fmt::format("Invalid seconds value: {}", value));
    }

    const int seconds = to_int(digits, "seconds");
    if (seconds <= 0 || seconds >= constants::CONTROL_PAUSE_LIMIT) {
        throw std::invalid_argument(fmt::format("Seconds must be between 1 and {}",
                                                constants::CONTROL_PAUSE_LIMIT - 1));
    }

    return entry::ControlPause{
        .seconds    = seconds,
        .conditions = resolve_conditions(tokens.subspan(1), EntryKind::ControlPause, ctx),
        .timestamp  = ctx.timestamp,
        .tags       = ctx.tags,
    };
}

} // namespace vitalog::parser::detail
