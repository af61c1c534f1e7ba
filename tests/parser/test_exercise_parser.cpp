#include <gtest/gtest.h>
#include "../../src/parser/field_parsers.hpp"
#include "vitalog/errors.hpp"
#include "vitalog/parser.hpp"

#include <stdexcept>
#include <vector>

using namespace vitalog;
using namespace vitalog::parser;

namespace {

const Timestamp NOW = make_timestamp(2026, 1, 15, 9, 0, 0);

class ExerciseParserTest : public ::testing::Test {
protected:
    aliases::AliasResolver resolver{aliases::AliasMap{
        {"exercises", {{"sq", "squat"}, {"bp", "bench press"}}},
    }};
    EntryParser parser{resolver};

    entry::Exercise parse(std::string_view text) const {
        return std::get<entry::Exercise>(parser.parse(text, NOW));
    }
};

} // anonymous namespace

// ─── Token patterns ───────────────────────────────────────────────────────────

TEST(TokenPatterns_Reps, RecognizedForms) {
    EXPECT_TRUE(detail::is_reps_pattern("3x5"));
    EXPECT_TRUE(detail::is_reps_pattern("5,5,8"));
    EXPECT_TRUE(detail::is_reps_pattern("10"));
}

TEST(TokenPatterns_Reps, RejectedForms) {
    EXPECT_FALSE(detail::is_reps_pattern("3x"));
    EXPECT_FALSE(detail::is_reps_pattern("x5"));
    EXPECT_FALSE(detail::is_reps_pattern("5,,5"));
    EXPECT_FALSE(detail::is_reps_pattern("5,"));
    EXPECT_FALSE(detail::is_reps_pattern("10kg"));
    EXPECT_FALSE(detail::is_reps_pattern("12.5"));
    EXPECT_FALSE(detail::is_reps_pattern("heavy"));
}

TEST(TokenPatterns_Reps, Expansion) {
    EXPECT_EQ(detail::parse_reps("3x5"), (std::vector<int>{5, 5, 5}));
    EXPECT_EQ(detail::parse_reps("8,6,4"), (std::vector<int>{8, 6, 4}));
    EXPECT_EQ(detail::parse_reps("10"), (std::vector<int>{10}));
}

TEST(TokenPatterns_Reps, ZeroCountsAreRejected) {
    EXPECT_THROW((void)detail::parse_reps("0x5"), RepsParseError);
    EXPECT_THROW((void)detail::parse_reps("3x0"), RepsParseError);
    EXPECT_THROW((void)detail::parse_reps("5,0"), RepsParseError);
}

TEST(TokenPatterns_Reps, SetCountIsCapped) {
    EXPECT_EQ(detail::parse_reps("100x1").size(), 100u);
    EXPECT_THROW((void)detail::parse_reps("101x1"), RepsParseError);
    EXPECT_THROW((void)detail::parse_reps("2000000000x1"), RepsParseError);
}

TEST(TokenPatterns_Weight, DecimalWithOptionalKg) {
    EXPECT_EQ(detail::match_weight("100"), 100.0);
    EXPECT_EQ(detail::match_weight("42.5kg"), 42.5);
    EXPECT_FALSE(detail::match_weight("kg").has_value());
    EXPECT_FALSE(detail::match_weight("3x5").has_value());
    EXPECT_FALSE(detail::match_weight("-5").has_value());
}

TEST(TokenPatterns_Rpe, InRangeOnly) {
    EXPECT_EQ(detail::match_rpe("8"), 8.0);
    EXPECT_EQ(detail::match_rpe("rpe8"), 8.0);
    EXPECT_EQ(detail::match_rpe("rpe7.5"), 7.5);
    EXPECT_EQ(detail::match_rpe("10"), 10.0);
    EXPECT_EQ(detail::match_rpe("1"), 1.0);
    EXPECT_FALSE(detail::match_rpe("11").has_value());
    EXPECT_FALSE(detail::match_rpe("0").has_value());
    EXPECT_FALSE(detail::match_rpe("rpe12").has_value());
    EXPECT_FALSE(detail::match_rpe("rpe").has_value());
}

TEST(TokenPatterns_Bodyfat, OptionalPercent) {
    EXPECT_EQ(detail::match_bodyfat("18%"), 18.0);
    EXPECT_EQ(detail::match_bodyfat("18.5"), 18.5);
    EXPECT_FALSE(detail::match_bodyfat("lean").has_value());
}

TEST(TokenPatterns_Numbers, ConversionFailuresNameTheField) {
    try {
        (void)detail::to_int("abc", "BPM");
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), "Invalid BPM value: 'abc'");
    }
    EXPECT_THROW((void)detail::to_int("58.5", "BPM"), std::invalid_argument);
    EXPECT_THROW((void)detail::to_double("nan", "Celsius"), std::invalid_argument);
    EXPECT_THROW((void)detail::to_double("", "Celsius"), std::invalid_argument);
    EXPECT_DOUBLE_EQ(detail::to_double("37.2", "Celsius"), 37.2);
}

// ─── Weight / reps / RPE disambiguation ───────────────────────────────────────

TEST_F(ExerciseParserTest, WeightThenSetsByReps) {
    const auto e = parse("squat 100 3x5");
    EXPECT_EQ(e.name, "squat");
    EXPECT_EQ(e.weight_kg, 100.0);
    EXPECT_EQ(e.reps, (std::vector<int>{5, 5, 5}));
    EXPECT_FALSE(e.rpe.has_value());
}

TEST_F(ExerciseParserTest, PyramidIsKeptVerbatim) {
    const auto e = parse("bench 80 5,5,8");
    EXPECT_EQ(e.weight_kg, 80.0);
    EXPECT_EQ(e.reps, (std::vector<int>{5, 5, 8}));
}

TEST_F(ExerciseParserTest, LoneNumberIsReps) {
    const auto e = parse("pushups 10");
    EXPECT_FALSE(e.weight_kg.has_value());
    EXPECT_EQ(e.reps, (std::vector<int>{10}));
}

TEST_F(ExerciseParserTest, LoneSmallNumberIsRepsNotRpe) {
    const auto e = parse("pushups 8");
    EXPECT_EQ(e.reps, (std::vector<int>{8}));
    EXPECT_FALSE(e.rpe.has_value());
}

TEST_F(ExerciseParserTest, NumberFollowedByRepsIsWeight) {
    const auto e = parse("pushups 10 8");
    EXPECT_EQ(e.weight_kg, 10.0);
    EXPECT_EQ(e.reps, (std::vector<int>{8}));
}

TEST_F(ExerciseParserTest, KgSuffixedWeight) {
    const auto e = parse("squat 42.5kg 5");
    EXPECT_EQ(e.weight_kg, 42.5);
    EXPECT_EQ(e.reps, (std::vector<int>{5}));
}

TEST_F(ExerciseParserTest, RpeAfterReps) {
    EXPECT_EQ(parse("squat 100 3x5 8").rpe, 8.0);
    EXPECT_EQ(parse("squat 100 3x5 rpe8.5").rpe, 8.5);
}

TEST_F(ExerciseParserTest, FirstRpeWins) {
    EXPECT_EQ(parse("squat 100 3x5 8 9").rpe, 8.0);
}

TEST_F(ExerciseParserTest, OutOfRangeRpeIsIgnored) {
    const auto e = parse("squat 100 3x5 15");
    EXPECT_FALSE(e.rpe.has_value());
    EXPECT_EQ(e.reps, (std::vector<int>{5, 5, 5}));
}

TEST_F(ExerciseParserTest, StrayWordsAreIgnored) {
    const auto e = parse("squat felt heavy 100 3x5");
    EXPECT_EQ(e.weight_kg, 100.0);
    EXPECT_EQ(e.reps, (std::vector<int>{5, 5, 5}));
}

TEST_F(ExerciseParserTest, ZeroWeightIsBodyweight) {
    const auto e = parse("pullups 0 3x10");
    EXPECT_FALSE(e.weight_kg.has_value());
    EXPECT_EQ(e.reps, (std::vector<int>{10, 10, 10}));
}

TEST_F(ExerciseParserTest, NameIsAliasResolved) {
    EXPECT_EQ(parse("sq 100 5x5").name, "squat");
    EXPECT_EQ(parse("bp 80 5").name, "bench press");
    EXPECT_EQ(parse("deadlift 140 5").name, "deadlift");
}

TEST_F(ExerciseParserTest, NoRepsThrows) {
    EXPECT_THROW((void)parser.parse("squat", NOW), RepsParseError);
    EXPECT_THROW((void)parser.parse("squat 42.5kg", NOW), RepsParseError);
    EXPECT_THROW((void)parser.parse("squat heavy", NOW), RepsParseError);
}

TEST_F(ExerciseParserTest, HugeSetCountIsRejected) {
    EXPECT_THROW((void)parser.parse("squat 2000000000x1", NOW), std::invalid_argument);
    EXPECT_THROW((void)parser.parse("squat 100 2000000000x5", NOW), RepsParseError);
}

TEST_F(ExerciseParserTest, RepsErrorMessage) {
    try {
        (void)parser.parse("squat", NOW);
        FAIL() << "expected RepsParseError";
    } catch (const RepsParseError& e) {
        EXPECT_STREQ(e.what(), "Could not parse reps");
    }
}
