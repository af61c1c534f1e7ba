/// @file tests/integration/test_full_pipeline.cpp
/// @brief End-to-end tests for the full vitalog pipeline.
///
/// These tests exercise the complete path:
///   alias file → AliasConfigLoader → AliasResolver → EntryParser →
///   display / JSON export → JSON import

#include "vitalog/alias_config.hpp"
#include "vitalog/aliases.hpp"
#include "vitalog/entry.hpp"
#include "vitalog/errors.hpp"
#include "vitalog/parser.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace vitalog;

namespace {

const Timestamp NOW = make_timestamp(2026, 1, 15, 9, 0, 0);

class FullPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto map = config::AliasConfigLoader::load_file(VITALOG_DEFAULT_ALIASES);
        ASSERT_TRUE(map.has_value());
        resolver.reload(std::move(*map));
    }

    std::string render(std::string_view text) const {
        return entry::display(entry_parser.parse(text, NOW));
    }

    aliases::AliasResolver resolver;
    parser::EntryParser    entry_parser{resolver};
};

} // anonymous namespace

// ─── Display strings ──────────────────────────────────────────────────────────

TEST_F(FullPipelineTest, RendersEveryKind) {
    EXPECT_EQ(render("sq 100 3x5 rpe8 @gym"), "squat 100kg [5,5,5] RPE 8 @gym");
    EXPECT_EQ(render("pu 3x10"), "pullups (BW) [10,10,10]");
    EXPECT_EQ(render("hr 58 rest pp @oura"), "HR 58 bpm (resting, postprandial) @oura");
    EXPECT_EQ(render("hrv 45 morning"), "HRV 45ms (rmssd) (morning)");
    EXPECT_EQ(render("temp 37.2 mouth meal"), "Temp 37.2°C (postprandial, oral)");
    EXPECT_EQ(render("weight 82.5 18%"), "Weight 82.5kg (18% BF)");
    EXPECT_EQ(render("cp 45s morning"), "CP 45s (morning)");
}

TEST_F(FullPipelineTest, MultiWordCanonicalExerciseName) {
    EXPECT_EQ(render("bp 80 5,5,8"), "bench press 80kg [5,5,8]");
}

// ─── Export round-trip ────────────────────────────────────────────────────────

TEST_F(FullPipelineTest, ExportImportPreservesDisplay) {
    const std::vector<std::string> lines = {
        "squat 100 3x5",
        "bench 80 5,5,8 rpe9 @gym @evening-session",
        "pushups 20",
        "hr 58 resting postprandial",
        "@yesterday hrv 61.5 sdnn evening relaxed @oura",
        "temp 37.2 oral postprandial",
        "@2026-01-10 bw 81.2 17%",
        "@6:45 cp 38 waking fasted",
    };
    for (const auto& line : lines) {
        const auto parsed   = entry_parser.parse(line, NOW);
        const auto restored = entry::from_json(
            nlohmann::json::parse(entry::to_json(parsed).dump()));
        EXPECT_EQ(entry::display(restored), entry::display(parsed)) << line;
        EXPECT_EQ(entry::timestamp_of(restored), entry::timestamp_of(parsed)) << line;
        EXPECT_EQ(entry::kind_of(restored), entry::kind_of(parsed)) << line;
    }
}

// ─── Failures ─────────────────────────────────────────────────────────────────

TEST_F(FullPipelineTest, EveryFailureIsAnInvalidArgument) {
    const std::vector<std::string> bad = {
        "", "squat", "hr", "hr 58 oral", "hr 58 resting active",
        "cp 900", "temp warm", "@25:00 hr 60",
    };
    for (const auto& line : bad) {
        EXPECT_THROW((void)entry_parser.parse(line, NOW), std::invalid_argument) << line;
    }
}

TEST_F(FullPipelineTest, ConditionAliasToTechniqueStillChecked) {
    // "mouth" resolves to "oral", which heart-rate entries cannot carry.
    EXPECT_THROW((void)entry_parser.parse("hr 60 mouth", NOW), InapplicableConditionError);
}

// ─── Concurrent reload ────────────────────────────────────────────────────────

TEST_F(FullPipelineTest, ParsesStayConsistentWhileAliasesReload) {
    const aliases::AliasMap a = {{"exercises", {{"sq", "squat"}}},
                                 {"conditions", {{"x", "resting"}}}};
    const aliases::AliasMap b = {{"exercises", {{"sq", "front squat"}}},
                                 {"conditions", {{"x", "active"}}}};
    resolver.reload(a);

    std::atomic<bool> stop{false};
    std::atomic<int>  unexpected{0};

    std::thread writer([&] {
        for (int i = 0; i < 1000; ++i) {
            resolver.reload(i % 2 == 0 ? b : a);
        }
        stop = true;
    });

    std::vector<std::thread> readers;
    for (int t = 0; t < 3; ++t) {
        readers.emplace_back([&] {
            while (!stop.load()) {
                const auto name = std::get<entry::Exercise>(entry_parser.parse("sq 100 5", NOW)).name;
                const auto hr   = std::get<entry::HeartRate>(entry_parser.parse("hr 60 x", NOW));
                if ((name != "squat" && name != "front squat") ||
                    (hr.conditions != "resting" && hr.conditions != "active")) {
                    ++unexpected;
                }
            }
        });
    }

    writer.join();
    for (auto& reader : readers) reader.join();
    EXPECT_EQ(unexpected.load(), 0);
}
