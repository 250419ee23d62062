#include <gtest/gtest.h>

#include "reelcut/Utility.h"
#include "reelcut/planning/PartPlanner.h"
#include "reelcut/planning/Schedule.h"
#include "reelcut/planning/TitleGenerator.h"

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

using namespace reelcut;
using namespace reelcut::planning;
using namespace std::chrono;

static Clip make_clip(const std::string &id, double t0, double t1, double score,
                      std::vector<Keyword> keywords = {}) {
    Clip clip;
    clip.id = id;
    clip.clipId = id;
    clip.t0 = t0;
    clip.t1 = t1;
    clip.duration = t1 - t0;
    clip.finalScore = score;
    clip.keywords = std::move(keywords);
    clip.mergedFrom = {id};
    return clip;
}

static bool contains(const std::string &haystack, const std::string &needle) {
    return haystack.find(needle) != std::string::npos;
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Split ladder
// ═══════════════════════════════════════════════════════════════════════════════

TEST(SplitLadder, PartCounts) {
    EXPECT_EQ(PartPlanner::partsForDuration(1800), 1);
    EXPECT_EQ(PartPlanner::partsForDuration(3600), 2);
    EXPECT_EQ(PartPlanner::partsForDuration(7199), 2);
    EXPECT_EQ(PartPlanner::partsForDuration(7200), 3);
    EXPECT_EQ(PartPlanner::partsForDuration(14399), 3);
    EXPECT_EQ(PartPlanner::partsForDuration(14400), 4);
    EXPECT_EQ(PartPlanner::partsForDuration(18000), 4);
    EXPECT_EQ(PartPlanner::partsForDuration(43200), 3);
    EXPECT_EQ(PartPlanner::partsForDuration(72000), 5);
    EXPECT_EQ(PartPlanner::partsForDuration(100000), 6);
}

TEST(SplitLadder, TargetPerPartIsClamped) {
    EXPECT_EQ(PartPlanner::targetPerPart(18000, 4), 720);
    EXPECT_EQ(PartPlanner::targetPerPart(30000, 3), 1000);
    EXPECT_EQ(PartPlanner::targetPerPart(50000, 4), 1200);
}

TEST(SplitLadder, ThresholdsUseStrictBounds) {
    EXPECT_DOUBLE_EQ(PartPlanner::thresholdFor(3600), 0.45);
    EXPECT_DOUBLE_EQ(PartPlanner::thresholdFor(14400), 0.45);
    EXPECT_DOUBLE_EQ(PartPlanner::thresholdFor(18000), 0.50);
    EXPECT_DOUBLE_EQ(PartPlanner::thresholdFor(21600), 0.50);
    EXPECT_DOUBLE_EQ(PartPlanner::thresholdFor(21601), 0.55);
}

TEST(SplitLadder, FiveHourSource) {
    const PartPlanner planner(SplitterConfig{});
    const auto plan = planner.calculateSplitStrategy(18000);
    EXPECT_EQ(plan.numParts, 4);
    EXPECT_GE(plan.targetDurationPerPart, 720);
    EXPECT_LE(plan.targetDurationPerPart, 1200);
    EXPECT_EQ(plan.totalTargetDuration, plan.targetDurationPerPart * plan.numParts);
    EXPECT_DOUBLE_EQ(plan.minScoreThreshold, 0.50);
    EXPECT_NEAR(plan.compressionRatio, 2880.0 / 18000.0, 1e-9);
    EXPECT_TRUE(contains(plan.reason, "4-6h"));
    EXPECT_TRUE(plan.parts.empty());
}

TEST(SplitLadder, ManualOverrides) {
    SplitterConfig config;
    config.overrideParts = 2;
    config.overrideTargetMinutes = 15;
    const PartPlanner planner(config);
    const auto plan = planner.calculateSplitStrategy(18000);
    EXPECT_EQ(plan.numParts, 2);
    EXPECT_EQ(plan.targetDurationPerPart, 900);
    EXPECT_EQ(plan.totalTargetDuration, 1800);
    EXPECT_TRUE(contains(plan.reason, "manual override"));
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Bin-packing
// ═══════════════════════════════════════════════════════════════════════════════

TEST(PartPacking, SpreadsEvenlyByFill) {
    const PartPlanner planner(SplitterConfig{});
    std::vector<Clip> clips;
    for (int i = 0; i < 6; ++i) clips.push_back(make_clip("c" + std::to_string(i), i * 500.0, i * 500.0 + 100, 0.5));

    const auto parts = planner.packClips(clips, 3, 200);
    ASSERT_EQ(parts.size(), 3u);
    for (const auto &part : parts) {
        ASSERT_EQ(part.size(), 2u);
        EXPECT_DOUBLE_EQ(total_duration(part), 200.0);
        EXPECT_LT(part[0].t0, part[1].t0);
    }
    EXPECT_EQ(parts[0][0].id, "c0");
    EXPECT_EQ(parts[0][1].id, "c3");
}

TEST(PartPacking, OverflowGoesToLeastFilledPart) {
    const PartPlanner planner(SplitterConfig{});
    std::vector<Clip> clips;
    for (int i = 0; i < 5; ++i) clips.push_back(make_clip("c" + std::to_string(i), i * 100.0, i * 100.0 + 60, 0.5));

    const auto parts = planner.packClips(clips, 2, 100);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0].size() + parts[1].size(), 5u);
    EXPECT_DOUBLE_EQ(total_duration(parts[0]), 180.0);
    EXPECT_DOUBLE_EQ(total_duration(parts[1]), 120.0);
}

TEST(PartPacking, QualityTermBalancesScores) {
    const PartPlanner planner(SplitterConfig{});
    const std::vector<Clip> clips{
        make_clip("strong", 0, 10, 0.9),
        make_clip("weak", 100, 110, 0.1),
    };
    // Fill is almost equal after the first clip, so the weak clip joins the
    // strong one to pull both averages toward the global mean.
    const auto parts = planner.packClips(clips, 2, 10000);
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].size(), 2u);
}

TEST(PartPacking, EmptyPartsAreRemoved) {
    const PartPlanner planner(SplitterConfig{});
    const auto parts = planner.packClips({make_clip("only", 0, 100, 0.7)}, 3, 720);
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_TRUE(planner.packClips({}, 3, 720).empty());
}

TEST(PartPacking, PlanPartsSchedulesAndNames) {
    const PartPlanner planner(SplitterConfig{});
    auto plan = planner.calculateSplitStrategy(5000);
    ASSERT_EQ(plan.numParts, 2);

    std::vector<Clip> clips;
    for (int i = 0; i < 4; ++i) clips.push_back(make_clip("c" + std::to_string(i), i * 1000.0, i * 1000.0 + 300, 0.6));

    const TitleGenerator titles(TitleConfig{}, "Parliament Session");
    planner.planParts(plan, clips, year{2024} / 3 / 10, titles);

    ASSERT_EQ(plan.parts.size(), 2u);
    EXPECT_EQ(plan.parts[0].partNumber, 1);
    EXPECT_EQ(plan.parts[0].totalParts, 2);
    EXPECT_EQ(plan.parts[0].publishAt, "2024-03-11T18:00:00");
    EXPECT_EQ(plan.parts[1].publishAt, "2024-03-12T18:00:00");
    EXPECT_EQ(plan.parts[0].filenameSuffix, "_part1of2");
    EXPECT_EQ(plan.parts[0].title, "Parliament Session - Best Moments | Part 1/2 | 11.03.2024");
    EXPECT_DOUBLE_EQ(plan.parts[0].avgScore, 0.6);
    EXPECT_DOUBLE_EQ(plan.parts[0].duration + plan.parts[1].duration, 1200.0);

    const auto summary = format_split_summary(plan);
    EXPECT_TRUE(contains(summary, "Split plan"));
    EXPECT_TRUE(contains(summary, "part 2/2"));
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Schedule
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Schedule, ParsesIsoDates) {
    const auto date = parse_date("2024-03-10");
    EXPECT_EQ(date, year{2024} / 3 / 10);
    EXPECT_THROW(parse_date("2024-02-30"), std::runtime_error);
    EXPECT_THROW(parse_date("yesterday"), std::runtime_error);
    EXPECT_THROW(parse_date("2024-03-10x"), std::runtime_error);
}

TEST(Schedule, AddsDaysAcrossBoundaries) {
    EXPECT_EQ(add_days(year{2024} / 12 / 31, 1), year{2025} / 1 / 1);
    EXPECT_EQ(add_days(year{2024} / 2 / 28, 1), year{2024} / 2 / 29);
    EXPECT_EQ(publish_date(year{2024} / 3 / 10, 1, 2), year{2024} / 3 / 13);
}

TEST(Schedule, Formats) {
    EXPECT_EQ(format_publish_time(year{2024} / 3 / 5, 9, 5), "2024-03-05T09:05:00");
    EXPECT_EQ(format_title_date(year{2024} / 3 / 5), "05.03.2024");
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Titles
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Titles, TwoEntitiesFaceOff) {
    TitleConfig config;
    config.entityNames = {"Smith", "Jones"};
    const TitleGenerator titles(config, "Parliament Session");
    const std::vector<Clip> clips{
        make_clip("a", 0, 60, 0.9, {{"smith", 3.0, ""}, {"budget", 2.0, ""}}),
        make_clip("b", 100, 160, 0.8, {{"minister jones", 3.0, ""}}),
    };
    EXPECT_EQ(titles.partTitle(clips, 1, 1, ""), "Smith vs Minister jones - Parliament Session");
}

TEST(Titles, SingleEntityInFocus) {
    TitleConfig config;
    config.entityNames = {"Smith"};
    const TitleGenerator titles(config, "Parliament Session");
    const std::vector<Clip> clips{make_clip("a", 0, 60, 0.9, {{"smith", 3.0, ""}, {"budget", 2.0, ""}})};
    EXPECT_EQ(titles.partTitle(clips, 1, 1, "01.01.2025"), "Smith in focus - Parliament Session | 01.01.2025");
}

TEST(Titles, KeywordForms) {
    const TitleGenerator titles(TitleConfig{}, "Parliament Session");
    const std::vector<Clip> two{make_clip("a", 0, 60, 0.9, {{"tax", 1.0, ""}, {"budget", 2.0, ""}})};
    EXPECT_EQ(titles.partTitle(two, 1, 1, ""), "Parliament Session: Budget vs Tax");

    const TitleGenerator stream(TitleConfig{}, "Stream Highlights");
    const std::vector<Clip> one{make_clip("a", 0, 60, 0.9, {{"clutch", 1.0, ""}})};
    EXPECT_EQ(stream.partTitle(one, 1, 1, ""), "Stream Highlights: Clutch");

    const std::vector<Clip> none{make_clip("a", 0, 60, 0.9)};
    EXPECT_EQ(stream.partTitle(none, 2, 3, "12.03.2024"), "Stream Highlights - Best Moments | Part 2/3 | 12.03.2024");
}

TEST(Titles, TruncatesByCodePoint) {
    std::string longToken;
    for (int i = 0; i < 150; ++i) longToken += "\xC5\xBC";  // U+017C
    const TitleGenerator titles(TitleConfig{}, "Context");
    const std::vector<Clip> clips{make_clip("a", 0, 60, 0.9, {{longToken, 1.0, ""}})};
    const auto title = titles.partTitle(clips, 1, 1, "");
    EXPECT_EQ(utf8_length(title), 100u);
    EXPECT_EQ(title.substr(title.size() - 3), "...");
    EXPECT_EQ(TitleGenerator::truncate("short"), "short");
}

TEST(Titles, LongHeadlineKeepsPartAndDate) {
    std::string longToken(140, 'x');
    const TitleGenerator titles(TitleConfig{}, "Context");
    const std::vector<Clip> clips{make_clip("a", 0, 60, 0.9, {{longToken, 1.0, ""}})};
    const std::string suffix = " | Part 2/4 | 05.01.2025";

    const auto title = titles.partTitle(clips, 2, 4, "05.01.2025");
    EXPECT_EQ(utf8_length(title), 100u);
    ASSERT_GT(title.size(), suffix.size());
    EXPECT_EQ(title.substr(title.size() - suffix.size()), suffix);
    EXPECT_EQ(title.substr(title.size() - suffix.size() - 3, 3), "...");
    EXPECT_EQ(title.rfind("Context: X", 0), 0u);
}

TEST(Titles, ClipTitleUsesTopThreeKeywords) {
    const auto clip = make_clip("a", 0, 60, 0.9,
                                {{"vote", 1.0, ""}, {"budget", 3.0, ""}, {"tax", 2.0, ""}, {"extra", 0.5, ""}});
    EXPECT_EQ(TitleGenerator::clipTitle(clip), "Budget \xE2\x80\xA2 Tax \xE2\x80\xA2 Vote");
    EXPECT_EQ(TitleGenerator::clipTitle(make_clip("b", 0, 60, 0.9)), "Notable moment");
}

TEST(Titles, PartKeywordsAreDistinctAndCapped) {
    const TitleGenerator titles(TitleConfig{}, "Context");
    std::vector<Keyword> many;
    for (int i = 0; i < 12; ++i) many.push_back({"k" + std::to_string(i), 1.0, ""});
    const std::vector<Clip> clips{
        make_clip("a", 0, 60, 0.9, {{"budget", 1.0, ""}}),
        make_clip("b", 100, 160, 0.8, {{"budget", 1.0, ""}, {"tax", 1.0, ""}}),
        make_clip("c", 200, 260, 0.7, many),
    };
    const auto keywords = titles.partKeywords(clips);
    ASSERT_EQ(keywords.size(), 10u);
    EXPECT_EQ(keywords[0], "budget");
    EXPECT_EQ(keywords[1], "tax");
    EXPECT_EQ(keywords[2], "k0");
}
