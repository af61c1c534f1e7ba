/// @file src/conditions/condition_resolver.cpp
/// @brief ConditionResolver: canonical ordering and conflict detection.

#include "vitalog/conditions.hpp"
#include "vitalog/errors.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <map>
#include <ranges>
#include <string_view>

namespace vitalog::conditions {

namespace {

/// Resolved values keyed by dimension priority, so iteration order is the
/// canonical order.
using ResolvedByPriority = std::map<int, std::string>;

/// Record `value` under `dim` after the applicability and exclusivity checks.
void record(ResolvedByPriority& found, const Dimension& dim,
            const std::string& value, EntryKind kind) {
    if (!dim.applies_to(kind)) {
        throw InapplicableConditionError(value, kind, dim.name);
    }
    const auto [it, inserted] = found.emplace(dim.priority, value);
    if (!inserted) {
        throw ConditionConflictError(dim.name, it->second, value);
    }
}

} // anonymous namespace

// ─── ConditionResolver::resolve ───────────────────────────────────────────────

std::optional<std::string>
ConditionResolver::resolve(std::span<const std::string> tokens,
                           EntryKind kind,
                           const aliases::CategoryMap& alias_map) {
    ResolvedByPriority found;

    for (const auto& token : tokens) {
        const auto alias = alias_map.find(token);
        const std::string& resolved = alias == alias_map.end() ? token : alias->second;

        const Dimension* dim = dimension_of(resolved);
        if (dim == nullptr) {
            continue;  // not a condition; another sub-parser may want it
        }
        record(found, *dim, resolved, kind);
    }

    if (found.empty()) {
        return std::nullopt;
    }
    return fmt::format("{}", fmt::join(found | std::views::values, ","));
}

// ─── ConditionResolver::validate ──────────────────────────────────────────────

void ConditionResolver::validate(const std::optional<std::string>& conditions,
                                 EntryKind kind) {
    if (!conditions) {
        return;
    }

    // Every comma-separated field counts, empty ones included: "", ",resting"
    // and "resting," each carry an empty value, which is not a condition.
    ResolvedByPriority found;
    const std::string_view stored = *conditions;
    std::size_t start = 0;

    while (true) {
        const std::size_t comma = stored.find(',', start);
        const std::string value(stored.substr(start, comma - start));

        const Dimension* dim = dimension_of(value);
        if (dim == nullptr) {
            throw InapplicableConditionError(value, kind, std::nullopt);
        }
        record(found, *dim, value, kind);

        if (comma == std::string_view::npos) {
            return;
        }
        start = comma + 1;
    }
}

// ─── ConditionResolver::format ────────────────────────────────────────────────

std::string ConditionResolver::format(const std::optional<std::string>& conditions) {
    if (!conditions || conditions->empty()) {
        return {};
    }

    std::string out = "(";
    for (char c : *conditions) {
        if (c == ',') {
            out += ", ";
        } else {
            out += c;
        }
    }
    out += ')';
    return out;
}

} // namespace vitalog::conditions
