#include <gtest/gtest.h>
#include "vitalog/conditions.hpp"
#include "vitalog/errors.hpp"

#include <string>
#include <vector>

using namespace vitalog;
using namespace vitalog::conditions;

namespace {

const aliases::CategoryMap NO_ALIASES;

std::optional<std::string> resolve(std::vector<std::string> tokens, EntryKind kind,
                                   const aliases::CategoryMap& aliases = NO_ALIASES) {
    return ConditionResolver::resolve(tokens, kind, aliases);
}

} // anonymous namespace

// ─── resolve ──────────────────────────────────────────────────────────────────

TEST(ConditionResolver_Resolve, NoTokensIsAbsent) {
    EXPECT_EQ(resolve({}, EntryKind::HeartRate), std::nullopt);
}

TEST(ConditionResolver_Resolve, OnlyUnknownTokensIsAbsent) {
    EXPECT_EQ(resolve({"banana", "42"}, EntryKind::HeartRate), std::nullopt);
}

TEST(ConditionResolver_Resolve, SingleValue) {
    EXPECT_EQ(resolve({"resting"}, EntryKind::HeartRate), "resting");
}

TEST(ConditionResolver_Resolve, OrderedByPriority) {
    EXPECT_EQ(resolve({"postprandial", "resting"}, EntryKind::HeartRate),
              "resting,postprandial");
    EXPECT_EQ(resolve({"oral", "postprandial"}, EntryKind::Temperature),
              "postprandial,oral");
}

TEST(ConditionResolver_Resolve, AllFiveDimensionsOnTemperature) {
    EXPECT_EQ(resolve({"ear", "relaxed", "fasted", "evening", "waking"},
                      EntryKind::Temperature),
              "waking,evening,fasted,relaxed,ear");
}

TEST(ConditionResolver_Resolve, UnknownTokensAreSkipped) {
    EXPECT_EQ(resolve({"after", "resting", "coffee"}, EntryKind::Hrv), "resting");
}

TEST(ConditionResolver_Resolve, AliasesAreApplied) {
    const aliases::CategoryMap aliases = {{"rest", "resting"}, {"pp", "postprandial"}};
    EXPECT_EQ(resolve({"pp", "rest"}, EntryKind::HeartRate, aliases),
              "resting,postprandial");
}

TEST(ConditionResolver_Resolve, AliasToNonConditionIsSkipped) {
    const aliases::CategoryMap aliases = {{"x", "not-a-condition"}};
    EXPECT_EQ(resolve({"x"}, EntryKind::HeartRate, aliases), std::nullopt);
}

TEST(ConditionResolver_Resolve, TechniqueOnHeartRateIsInapplicable) {
    try {
        (void)resolve({"oral"}, EntryKind::HeartRate);
        FAIL() << "expected InapplicableConditionError";
    } catch (const InapplicableConditionError& e) {
        EXPECT_EQ(e.value(), "oral");
        EXPECT_EQ(e.kind(), EntryKind::HeartRate);
        EXPECT_EQ(e.dimension(), "technique");
    }
}

TEST(ConditionResolver_Resolve, AnyConditionOnExerciseIsInapplicable) {
    EXPECT_THROW((void)resolve({"resting"}, EntryKind::Exercise), InapplicableConditionError);
    EXPECT_THROW((void)resolve({"fasted"}, EntryKind::Bodyweight), InapplicableConditionError);
}

TEST(ConditionResolver_Resolve, SameDimensionTwiceConflicts) {
    try {
        (void)resolve({"resting", "active"}, EntryKind::HeartRate);
        FAIL() << "expected ConditionConflictError";
    } catch (const ConditionConflictError& e) {
        EXPECT_EQ(e.dimension(), "activity");
        EXPECT_EQ(e.first(), "resting");
        EXPECT_EQ(e.second(), "active");
    }
}

TEST(ConditionResolver_Resolve, RepeatedValueConflictsWithItself) {
    EXPECT_THROW((void)resolve({"fasted", "fasted"}, EntryKind::Hrv), ConditionConflictError);
}

TEST(ConditionResolver_Resolve, ErrorsAreInvalidArgument) {
    EXPECT_THROW((void)resolve({"ear"}, EntryKind::ControlPause), std::invalid_argument);
}

// ─── validate ─────────────────────────────────────────────────────────────────

TEST(ConditionResolver_Validate, AbsentIsValid) {
    EXPECT_NO_THROW(ConditionResolver::validate(std::nullopt, EntryKind::HeartRate));
}

TEST(ConditionResolver_Validate, CanonicalStringIsValid) {
    EXPECT_NO_THROW(ConditionResolver::validate("resting,postprandial", EntryKind::HeartRate));
    EXPECT_NO_THROW(ConditionResolver::validate("postprandial,oral", EntryKind::Temperature));
}

TEST(ConditionResolver_Validate, UnknownValueHasNoDimension) {
    try {
        ConditionResolver::validate("resting,sleepy", EntryKind::HeartRate);
        FAIL() << "expected InapplicableConditionError";
    } catch (const InapplicableConditionError& e) {
        EXPECT_EQ(e.value(), "sleepy");
        EXPECT_FALSE(e.dimension().has_value());
    }
}

TEST(ConditionResolver_Validate, InapplicableAndConflicting) {
    EXPECT_THROW(ConditionResolver::validate("oral", EntryKind::Hrv),
                 InapplicableConditionError);
    EXPECT_THROW(ConditionResolver::validate("morning,evening", EntryKind::Hrv),
                 ConditionConflictError);
}

TEST(ConditionResolver_Validate, EmptyStringIsRejected) {
    EXPECT_THROW(ConditionResolver::validate(std::string{}, EntryKind::HeartRate),
                 InapplicableConditionError);
}

TEST(ConditionResolver_Validate, EmptyFieldAnywhereIsRejected) {
    for (const char* stored : {"resting,", ",resting", "resting,,postprandial", ","}) {
        try {
            ConditionResolver::validate(std::string(stored), EntryKind::HeartRate);
            FAIL() << "expected InapplicableConditionError for '" << stored << "'";
        } catch (const InapplicableConditionError& e) {
            EXPECT_EQ(e.value(), "") << stored;
            EXPECT_FALSE(e.dimension().has_value()) << stored;
        }
    }
}

// ─── format ───────────────────────────────────────────────────────────────────

TEST(ConditionResolver_Format, ParenthesizedCommaSpace) {
    EXPECT_EQ(ConditionResolver::format("resting,postprandial"), "(resting, postprandial)");
    EXPECT_EQ(ConditionResolver::format("morning"), "(morning)");
}

TEST(ConditionResolver_Format, AbsentOrEmptyIsEmpty) {
    EXPECT_EQ(ConditionResolver::format(std::nullopt), "");
    EXPECT_EQ(ConditionResolver::format(std::string{}), "");
}
