/// @file src/entry/parsed_entry.cpp
/// @brief ParsedEntry accessors and display strings.

#include "vitalog/entry.hpp"
#include "vitalog/conditions.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace vitalog::entry {

namespace {

using conditions::ConditionResolver;

/// " (resting, fasted)" or "".
std::string conditions_suffix(const std::optional<std::string>& conditions) {
    const std::string formatted = ConditionResolver::format(conditions);
    return formatted.empty() ? formatted : " " + formatted;
}

/// " @a @b" or "".
std::string tags_suffix(const Tags& tags) {
    std::string out;
    if (tags) {
        for (const auto& tag : *tags) {
            out += " @";
            out += tag;
        }
    }
    return out;
}

std::string display_record(const Exercise& e) {
    const std::string weight = e.weight_kg ? format_number(*e.weight_kg) + "kg" : "(BW)";
    const std::string rpe    = e.rpe ? " RPE " + format_number(*e.rpe) : "";
    return fmt::format("{} {} [{}]{}", e.name, weight, fmt::join(e.reps, ","), rpe);
}

std::string display_record(const HeartRate& e) {
    return fmt::format("HR {} bpm{}", e.bpm, conditions_suffix(e.conditions));
}

std::string display_record(const Hrv& e) {
    return fmt::format("HRV {}ms ({}){}", format_number(e.ms), e.metric,
                       conditions_suffix(e.conditions));
}

std::string display_record(const Temperature& e) {
    return fmt::format("Temp {}°C{}", format_number(e.celsius),
                       conditions_suffix(e.conditions));
}

std::string display_record(const Bodyweight& e) {
    const std::string bodyfat =
        e.bodyfat_pct ? fmt::format(" ({}% BF)", format_number(*e.bodyfat_pct)) : "";
    return fmt::format("Weight {}kg{}", format_number(e.kg), bodyfat);
}

std::string display_record(const ControlPause& e) {
    return fmt::format("CP {}s{}", e.seconds, conditions_suffix(e.conditions));
}

} // anonymous namespace

// ─── Accessors ────────────────────────────────────────────────────────────────

EntryKind kind_of(const ParsedEntry& entry) noexcept {
    return std::visit(Overloaded{
        [](const Exercise&)     { return EntryKind::Exercise; },
        [](const HeartRate&)    { return EntryKind::HeartRate; },
        [](const Hrv&)          { return EntryKind::Hrv; },
        [](const Temperature&)  { return EntryKind::Temperature; },
        [](const Bodyweight&)   { return EntryKind::Bodyweight; },
        [](const ControlPause&) { return EntryKind::ControlPause; },
    }, entry);
}

Timestamp timestamp_of(const ParsedEntry& entry) noexcept {
    return std::visit([](const auto& record) { return record.timestamp; }, entry);
}

const Tags& tags_of(const ParsedEntry& entry) noexcept {
    return std::visit([](const auto& record) -> const Tags& { return record.tags; }, entry);
}

std::optional<std::string> conditions_of(const ParsedEntry& entry) {
    return std::visit(Overloaded{
        [](const Exercise&)             -> std::optional<std::string> { return std::nullopt; },
        [](const Bodyweight&)           -> std::optional<std::string> { return std::nullopt; },
        [](const HeartRate& record)     -> std::optional<std::string> { return record.conditions; },
        [](const Hrv& record)           -> std::optional<std::string> { return record.conditions; },
        [](const Temperature& record)   -> std::optional<std::string> { return record.conditions; },
        [](const ControlPause& record)  -> std::optional<std::string> { return record.conditions; },
    }, entry);
}

// ─── Display ──────────────────────────────────────────────────────────────────

std::string format_number(double value) {
    return fmt::format("{}", value);
}

std::string display(const ParsedEntry& entry) {
    return std::visit([](const auto& record) {
        return display_record(record) + tags_suffix(record.tags);
    }, entry);
}

} // namespace vitalog::entry
