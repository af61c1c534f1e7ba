/// @file src/conditions/dimension_registry.cpp
/// @brief Static catalog of condition dimensions.

#include "vitalog/conditions.hpp"

namespace vitalog::conditions {

namespace {

const std::set<EntryKind> CONDITION_KINDS = {
    EntryKind::HeartRate, EntryKind::Hrv, EntryKind::Temperature, EntryKind::ControlPause,
};

std::vector<Dimension> build_catalog() {
    return {
        Dimension{
            .name             = "activity",
            .priority         = 1,
            .values           = {"waking", "resting", "active", "post-workout"},
            .applicable_kinds = CONDITION_KINDS,
        },
        Dimension{
            .name             = "time_of_day",
            .priority         = 2,
            .values           = {"morning", "evening"},
            .applicable_kinds = CONDITION_KINDS,
        },
        Dimension{
            .name             = "metabolic",
            .priority         = 3,
            .values           = {"postprandial", "fasted"},
            .applicable_kinds = CONDITION_KINDS,
        },
        Dimension{
            .name             = "emotional",
            .priority         = 4,
            .values           = {"stressed", "relaxed"},
            .applicable_kinds = CONDITION_KINDS,
        },
        // Only a thermometer has a measurement technique.
        Dimension{
            .name             = "technique",
            .priority         = 5,
            .values           = {"oral", "underarm", "forehead_ir", "ear"},
            .applicable_kinds = {EntryKind::Temperature},
        },
    };
}

} // anonymous namespace

const std::vector<Dimension>& all_dimensions() noexcept {
    static const std::vector<Dimension> catalog = build_catalog();
    return catalog;
}

std::vector<Dimension> applicable_dimensions(EntryKind kind) {
    std::vector<Dimension> out;
    for (const auto& dim : all_dimensions()) {
        if (dim.applies_to(kind)) {
            out.push_back(dim);
        }
    }
    return out;
}

std::set<std::string> applicable_values(EntryKind kind) {
    std::set<std::string> out;
    for (const auto& dim : all_dimensions()) {
        if (dim.applies_to(kind)) {
            out.insert(dim.values.begin(), dim.values.end());
        }
    }
    return out;
}

const Dimension* dimension_of(std::string_view value) noexcept {
    for (const auto& dim : all_dimensions()) {
        if (dim.values.contains(value)) {
            return &dim;
        }
    }
    return nullptr;
}

const Dimension* find_dimension(std::string_view name) noexcept {
    for (const auto& dim : all_dimensions()) {
        if (dim.name == name) {
            return &dim;
        }
    }
    return nullptr;
}

bool supports_conditions(EntryKind kind) noexcept {
    return CONDITION_KINDS.contains(kind);
}

} // namespace vitalog::conditions
