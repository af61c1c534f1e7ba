/// @file src/entry/entry_export.cpp
/// @brief ParsedEntry ⇄ JSON export form.

#include "vitalog/entry.hpp"
#include "vitalog/conditions.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace vitalog::entry {

namespace {

using nlohmann::json;
using conditions::ConditionResolver;

// ─── Writing ──────────────────────────────────────────────────────────────────

template <class T>
json optional_field(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

/// Common trailer: timestamp and tags.
void write_common(json& out, Timestamp timestamp, const Tags& tags) {
    out["timestamp"] = format_iso8601(timestamp);
    out["tags"]      = optional_field(tags);
}

json write_record(const Exercise& e) {
    return json{
        {"type", "exercise"},
        {"name", e.name},
        {"weight_kg", optional_field(e.weight_kg)},
        {"reps", e.reps},
        {"rpe", optional_field(e.rpe)},
    };
}

json write_record(const HeartRate& e) {
    return json{
        {"type", "hr"},
        {"bpm", e.bpm},
        {"conditions", optional_field(e.conditions)},
    };
}

json write_record(const Hrv& e) {
    return json{
        {"type", "hrv"},
        {"ms", e.ms},
        {"metric", e.metric},
        {"conditions", optional_field(e.conditions)},
    };
}

json write_record(const Temperature& e) {
    return json{
        {"type", "temp"},
        {"celsius", e.celsius},
        {"conditions", optional_field(e.conditions)},
    };
}

json write_record(const Bodyweight& e) {
    return json{
        {"type", "weight"},
        {"kg", e.kg},
        {"bodyfat_pct", optional_field(e.bodyfat_pct)},
    };
}

json write_record(const ControlPause& e) {
    return json{
        {"type", "cp"},
        {"seconds", e.seconds},
        {"conditions", optional_field(e.conditions)},
    };
}

// ─── Reading ──────────────────────────────────────────────────────────────────

/// A JSON integer that fits in `int`; `get<int>()` alone would truncate
/// 58.9 to 58.
bool is_int(const json& value) {
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>() <=
               static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    }
    if (!value.is_number_integer()) {
        return false;
    }
    const auto n = value.get<std::int64_t>();
    return n >= std::numeric_limits<int>::min() && n <= std::numeric_limits<int>::max();
}

/// Field `key`, converted to T. Missing or mistyped → std::invalid_argument.
template <class T>
T required(const json& doc, const char* key) {
    const auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        throw std::invalid_argument(fmt::format("missing field '{}'", key));
    }
    bool integral = true;
    if constexpr (std::is_same_v<T, int>) {
        integral = is_int(*it);
    } else if constexpr (std::is_same_v<T, std::vector<int>>) {
        integral = !it->is_array() ||
                   std::all_of(it->begin(), it->end(), [](const json& v) { return is_int(v); });
    }
    if (!integral) {
        throw std::invalid_argument(fmt::format("malformed field '{}': expected an integer", key));
    }
    try {
        return it->get<T>();
    } catch (const json::exception& ex) {
        throw std::invalid_argument(fmt::format("malformed field '{}': {}", key, ex.what()));
    }
}

/// Field `key`; absent or `null` → nullopt.
template <class T>
std::optional<T> nullable(const json& doc, const char* key) {
    const auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return std::nullopt;
    }
    return required<T>(doc, key);
}

Tags read_tags(const json& doc) {
    auto tags = nullable<std::vector<std::string>>(doc, "tags");
    if (tags && tags->empty()) {
        return std::nullopt;
    }
    return tags;
}

std::optional<std::string> read_conditions(const json& doc, EntryKind kind) {
    auto conditions = nullable<std::string>(doc, "conditions");
    ConditionResolver::validate(conditions, kind);
    return conditions;
}

ParsedEntry read_record(const json& doc, EntryKind kind) {
    const Timestamp timestamp = parse_iso8601(required<std::string>(doc, "timestamp"));
    Tags tags = read_tags(doc);

    switch (kind) {
        case EntryKind::Exercise: {
            auto reps = required<std::vector<int>>(doc, "reps");
            if (reps.empty()) {
                throw std::invalid_argument("exercise export has no reps");
            }
            return Exercise{
                .name      = required<std::string>(doc, "name"),
                .weight_kg = nullable<double>(doc, "weight_kg"),
                .reps      = std::move(reps),
                .rpe       = nullable<double>(doc, "rpe"),
                .timestamp = timestamp,
                .tags      = std::move(tags),
            };
        }
        case EntryKind::HeartRate:
            return HeartRate{
                .bpm        = required<int>(doc, "bpm"),
                .conditions = read_conditions(doc, kind),
                .timestamp  = timestamp,
                .tags       = std::move(tags),
            };
        case EntryKind::Hrv:
            return Hrv{
                .ms         = required<double>(doc, "ms"),
                .metric     = required<std::string>(doc, "metric"),
                .conditions = read_conditions(doc, kind),
                .timestamp  = timestamp,
                .tags       = std::move(tags),
            };
        case EntryKind::Temperature:
            return Temperature{
                .celsius    = required<double>(doc, "celsius"),
                .conditions = read_conditions(doc, kind),
                .timestamp  = timestamp,
                .tags       = std::move(tags),
            };
        case EntryKind::Bodyweight:
            return Bodyweight{
                .kg          = required<double>(doc, "kg"),
                .bodyfat_pct = nullable<double>(doc, "bodyfat_pct"),
                .timestamp   = timestamp,
                .tags        = std::move(tags),
            };
        case EntryKind::ControlPause:
            return ControlPause{
                .seconds    = required<int>(doc, "seconds"),
                .conditions = read_conditions(doc, kind),
                .timestamp  = timestamp,
                .tags       = std::move(tags),
            };
    }
    throw std::invalid_argument("unhandled entry kind");
}

} // anonymous namespace

// ─── to_json ──────────────────────────────────────────────────────────────────

json to_json(const ParsedEntry& entry) {
    return std::visit([](const auto& record) {
        json out = write_record(record);
        write_common(out, record.timestamp, record.tags);
        return out;
    }, entry);
}

// ─── from_json ────────────────────────────────────────────────────────────────

ParsedEntry from_json(const json& document) {
    if (!document.is_object()) {
        throw std::invalid_argument("entry export must be a JSON object");
    }
    const std::string type = required<std::string>(document, "type");
    const auto kind = entry_kind_from_string(type);
    if (!kind) {
        throw std::invalid_argument(fmt::format("unknown entry type '{}'", type));
    }
    return read_record(document, *kind);
}

} // namespace vitalog::entry
