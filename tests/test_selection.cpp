#include <gtest/gtest.h>

#include "reelcut/Utility.h"
#include "reelcut/selection/CandidateSelector.h"
#include "reelcut/selection/CoverageBalancer.h"
#include "reelcut/selection/DurationReconciler.h"
#include "reelcut/selection/ShortsSelector.h"

#include <cmath>
#include <string>
#include <vector>

using namespace reelcut;
using namespace reelcut::selection;

static Clip make_clip(const std::string &id, double t0, double t1, double score) {
    Clip clip;
    clip.id = id;
    clip.t0 = t0;
    clip.t1 = t1;
    clip.duration = t1 - t0;
    clip.finalScore = score;
    clip.mergedFrom = {id};
    return clip;
}

static Segment make_scored(const std::string &id, double t0, double t1, double score) {
    Segment seg;
    seg.id = id;
    seg.t0 = t0;
    seg.t1 = t1;
    seg.duration = t1 - t0;
    seg.finalScore = score;
    return seg;
}

static void expect_no_conflicts(const std::vector<Clip> &clips, double minGap) {
    for (std::size_t i = 0; i < clips.size(); ++i) {
        for (std::size_t j = i + 1; j < clips.size(); ++j) {
            EXPECT_FALSE(conflicts(clips[i], clips[j], minGap))
                << clips[i].id << " vs " << clips[j].id;
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Merge primitives
// ═══════════════════════════════════════════════════════════════════════════════

TEST(MergePrimitives, ConflictCoversOverlapTouchAndGap) {
    const auto a = make_clip("a", 0, 10, 0.5);
    EXPECT_TRUE(conflicts(a, make_clip("b", 5, 15, 0.5), 0.0));
    EXPECT_TRUE(conflicts(a, make_clip("c", 10, 20, 0.5), 0.0));
    EXPECT_TRUE(conflicts(a, make_clip("d", 20, 30, 0.5), 30.0));
    EXPECT_FALSE(conflicts(a, make_clip("e", 40, 50, 0.5), 30.0));
    EXPECT_FALSE(conflicts(make_clip("f", 40, 50, 0.5), a, 30.0));
}

TEST(MergePrimitives, MergedScoreIsConstituentMean) {
    const auto pair = merge_clips(make_clip("a", 0, 5, 0.8), make_clip("b", 6, 10, 0.8));
    const auto merged = merge_clips(pair, make_clip("c", 11, 15, 0.5));
    EXPECT_EQ(merged.id, "a+b+c");
    ASSERT_EQ(merged.mergedFrom.size(), 3u);
    EXPECT_EQ(merged.mergedFrom[2], "c");
    EXPECT_NEAR(merged.finalScore, (0.8 + 0.8 + 0.5) / 3.0, 1e-9);
    EXPECT_DOUBLE_EQ(merged.t0, 0.0);
    EXPECT_DOUBLE_EQ(merged.t1, 15.0);
    EXPECT_DOUBLE_EQ(merged.duration, 15.0);
}

TEST(MergePrimitives, KeywordsAreUnioned) {
    auto a = make_clip("a", 0, 5, 0.5);
    a.keywords = {{"budget", 2.0, ""}, {"vote", 1.0, ""}};
    auto b = make_clip("b", 6, 10, 0.5);
    b.keywords = {{"vote", 3.0, ""}, {"tax", 0.5, ""}};
    const auto merged = merge_clips(a, b);
    ASSERT_EQ(merged.keywords.size(), 3u);
    EXPECT_EQ(merged.keywords[0].token, "vote");
    EXPECT_DOUBLE_EQ(merged.keywords[0].weight, 3.0);
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Candidate selector stages
// ═══════════════════════════════════════════════════════════════════════════════

TEST(CandidateSelector, ShortBurstsMergeForward) {
    const CandidateSelector selector(SelectionConfig{});
    const auto out = selector.mergeShortBursts(
        {make_clip("a", 0, 3, 0.4), make_clip("b", 4, 7, 0.6), make_clip("c", 8, 20, 0.5)});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_DOUBLE_EQ(out[0].t0, 0.0);
    EXPECT_DOUBLE_EQ(out[0].t1, 20.0);
    EXPECT_EQ(out[0].mergedFrom.size(), 3u);
}

TEST(CandidateSelector, TrailingBurstFoldsIntoPrevious) {
    const CandidateSelector selector(SelectionConfig{});
    const auto out = selector.mergeShortBursts({make_clip("a", 0, 20, 0.4), make_clip("b", 21, 24, 0.6)});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_DOUBLE_EQ(out[0].t1, 24.0);
}

TEST(CandidateSelector, IsolatedBurstStaysAlone) {
    const CandidateSelector selector(SelectionConfig{});
    const auto out = selector.mergeShortBursts({make_clip("a", 0, 20, 0.4), make_clip("b", 100, 103, 0.6)});
    EXPECT_EQ(out.size(), 2u);
}

TEST(CandidateSelector, PercentileFallbackWhenNothingPasses) {
    const CandidateSelector selector(SelectionConfig{});
    std::vector<Clip> pool;
    for (int i = 1; i <= 5; ++i) pool.push_back(make_clip("c" + std::to_string(i), i * 100.0, i * 100.0 + 60, 0.1 * i));

    bool fallback = false;
    const auto kept = selector.filterByScore(pool, 0.9, fallback);
    EXPECT_TRUE(fallback);
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0].id, "c5");

    const auto normal = selector.filterByScore(pool, 0.3, fallback);
    EXPECT_FALSE(fallback);
    EXPECT_EQ(normal.size(), 3u);
}

TEST(CandidateSelector, DurationFilterIsInclusive) {
    SelectionConfig config;
    config.minClipDuration = 60;
    config.maxClipDuration = 120;
    const CandidateSelector selector(config);
    const auto kept = selector.filterByDuration(
        {make_clip("short", 0, 59, 0.9), make_clip("min", 100, 160, 0.9), make_clip("max", 200, 320, 0.9),
         make_clip("long", 400, 521, 0.9)});
    ASSERT_EQ(kept.size(), 2u);
    EXPECT_EQ(kept[0].id, "min");
    EXPECT_EQ(kept[1].id, "max");
}

TEST(CandidateSelector, SuppressionRespectsOvershootCeiling) {
    SelectionConfig config;
    config.targetTotalDuration = 100;
    const CandidateSelector selector(config);
    const auto out = selector.suppressOverlaps(
        {make_clip("big", 0, 90, 0.9), make_clip("mid", 500, 540, 0.8), make_clip("small", 1000, 1025, 0.7)});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].id, "big");
    EXPECT_EQ(out[1].id, "small");
    EXPECT_LE(total_duration(out), 120.0);
}

TEST(CandidateSelector, SuppressionStopsAtMaxClips) {
    SelectionConfig config;
    config.maxClips = 2;
    const CandidateSelector selector(config);
    const auto out = selector.suppressOverlaps(
        {make_clip("a", 0, 60, 0.5), make_clip("b", 200, 260, 0.9), make_clip("c", 400, 460, 0.7)});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].id, "b");
    EXPECT_EQ(out[1].id, "c");
}

TEST(CandidateSelector, GreedyPicksAlternateSegments) {
    SelectionConfig config;
    config.minClipDuration = 20;
    config.maxClipDuration = 60;
    config.maxClips = 40;
    config.minTimeGap = 30;
    config.targetTotalDuration = 900;

    std::vector<Segment> scored;
    for (int i = 0; i < 100; ++i) {
        scored.push_back(make_scored("s" + std::to_string(i), i * 30.0, i * 30.0 + 30.0, 0.9));
    }
    const CandidateSelector selector(config);
    const auto outcome = selector.select(scored);

    EXPECT_FALSE(outcome.relaxed);
    EXPECT_FALSE(outcome.percentileFallback);
    ASSERT_EQ(outcome.clips.size(), 30u);
    EXPECT_DOUBLE_EQ(total_duration(outcome.clips), 900.0);
    expect_no_conflicts(outcome.clips, config.minTimeGap);
    for (std::size_t i = 0; i < outcome.clips.size(); ++i) {
        EXPECT_DOUBLE_EQ(outcome.clips[i].t0, 60.0 * static_cast<double>(i));
    }
}

TEST(CandidateSelector, SmartMergeSpansTheGap) {
    SelectionConfig config;
    config.smartMergeGap = 10;
    const CandidateSelector selector(config);
    const auto out = selector.smartMerge({make_clip("a", 0, 6, 0.8), make_clip("b", 10, 14, 0.7)}, 180.0);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_DOUBLE_EQ(out[0].t0, 0.0);
    EXPECT_DOUBLE_EQ(out[0].t1, 14.0);
    EXPECT_DOUBLE_EQ(out[0].duration, 14.0);
    EXPECT_NEAR(out[0].finalScore, 0.75, 1e-9);
}

TEST(CandidateSelector, NearbyPairBecomesOneClip) {
    SelectionConfig config;
    config.smartMergeGap = 10;
    const CandidateSelector selector(config);
    const auto out = selector.smartMerge({make_clip("a", 0, 5, 0.8), make_clip("b", 7, 14, 0.8)}, 180.0);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].id, "a+b");
    EXPECT_DOUBLE_EQ(out[0].t0, 0.0);
    EXPECT_DOUBLE_EQ(out[0].t1, 14.0);
    EXPECT_DOUBLE_EQ(out[0].duration, 14.0);
}

TEST(CandidateSelector, SelectionIsRepeatable) {
    SelectionConfig config;
    config.minClipDuration = 20;
    config.maxClipDuration = 60;
    config.targetTotalDuration = 600;

    std::vector<Segment> scored;
    for (int i = 0; i < 60; ++i) {
        const double t0 = i * 40.0;
        const double length = 15.0 + (i * 7) % 40;
        scored.push_back(make_scored("s" + std::to_string(i), t0, t0 + length, 0.2 + 0.013 * ((i * 17) % 60)));
    }
    const CandidateSelector selector(config);
    const auto first = selector.select(scored);
    const auto second = selector.select(scored);

    ASSERT_FALSE(first.clips.empty());
    ASSERT_EQ(first.clips.size(), second.clips.size());
    for (std::size_t i = 0; i < first.clips.size(); ++i) {
        EXPECT_EQ(first.clips[i].id, second.clips[i].id);
        EXPECT_DOUBLE_EQ(first.clips[i].t0, second.clips[i].t0);
        EXPECT_DOUBLE_EQ(first.clips[i].t1, second.clips[i].t1);
        EXPECT_DOUBLE_EQ(first.clips[i].finalScore, second.clips[i].finalScore);
    }
    EXPECT_EQ(first.notes, second.notes);
    EXPECT_DOUBLE_EQ(first.threshold, second.threshold);
}

TEST(CandidateSelector, SmartMergeRespectsScoreAndLength) {
    SelectionConfig config;
    config.smartMergeGap = 10;
    const CandidateSelector selector(config);

    const auto weak = selector.smartMerge({make_clip("a", 0, 6, 0.8), make_clip("b", 10, 14, 0.5)}, 180.0);
    EXPECT_EQ(weak.size(), 2u);

    const auto tooLong = selector.smartMerge({make_clip("a", 0, 6, 0.8), make_clip("b", 10, 14, 0.9)}, 13.0);
    EXPECT_EQ(tooLong.size(), 2u);
}

TEST(CandidateSelector, ThinPoolRelaxesThreshold) {
    SelectionConfig config;
    config.minClipDuration = 60;
    config.maxClipDuration = 120;
    const CandidateSelector selector(config);

    std::vector<Segment> scored{make_scored("a", 0, 90, 0.2), make_scored("b", 300, 390, 0.3)};
    const auto outcome = selector.select(scored);
    EXPECT_TRUE(outcome.relaxed);
    EXPECT_NEAR(outcome.threshold, 0.15, 1e-9);
    EXPECT_EQ(outcome.clips.size(), 2u);
    EXPECT_FALSE(outcome.notes.empty());
}

TEST(CandidateSelector, ForceMergeOnLowCoverage) {
    SelectionConfig config;
    config.minClipDuration = 60;
    config.maxClipDuration = 180;
    config.minTimeGap = 0;
    const CandidateSelector selector(config);

    std::vector<Segment> scored{make_scored("a", 0, 90, 0.9), make_scored("b", 93, 190, 0.9)};
    const auto outcome = selector.select(scored);
    EXPECT_TRUE(outcome.forceMerged);
    ASSERT_EQ(outcome.clips.size(), 1u);
    EXPECT_DOUBLE_EQ(outcome.clips[0].duration, 190.0);
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Coverage balancer
// ═══════════════════════════════════════════════════════════════════════════════

TEST(CoverageBalancer, CapsAndFloorsScaleWithSource) {
    const CoverageBalancer balancer(SelectionConfig{});
    EXPECT_EQ(balancer.binCapFor(3600), 4);
    EXPECT_EQ(balancer.binCapFor(21600), 6);
    EXPECT_EQ(balancer.binCapFor(43200), 8);
    EXPECT_EQ(balancer.floorFor(3600), 8);
    EXPECT_EQ(balancer.floorFor(21600), 10);
    EXPECT_EQ(balancer.floorFor(43200), 15);
}

TEST(CoverageBalancer, BinIndexClampsToLastBin) {
    const CoverageBalancer balancer(SelectionConfig{});
    EXPECT_EQ(balancer.binIndex(0, 1000), 0);
    EXPECT_EQ(balancer.binIndex(199, 1000), 0);
    EXPECT_EQ(balancer.binIndex(200, 1000), 1);
    EXPECT_EQ(balancer.binIndex(999, 1000), 4);
    EXPECT_EQ(balancer.binIndex(1000, 1000), 4);
}

TEST(CoverageBalancer, KeepsBestPerBin) {
    SelectionConfig config;
    config.minClips = 1;
    const CoverageBalancer balancer(config);

    std::vector<Clip> clips;
    for (int i = 0; i < 10; ++i) {
        clips.push_back(make_clip("c" + std::to_string(i), i * 19.0, i * 19.0 + 10, 0.05 * i));
    }
    clips.push_back(make_clip("late", 900, 950, 0.1));

    const auto outcome = balancer.balance(clips, 1000);
    EXPECT_FALSE(outcome.backfilled);
    ASSERT_EQ(outcome.clips.size(), 5u);
    EXPECT_EQ(outcome.clips[0].id, "c6");
    EXPECT_EQ(outcome.clips[3].id, "c9");
    EXPECT_EQ(outcome.clips[4].id, "late");
}

TEST(CoverageBalancer, BackfillsToFloorByScore) {
    const CoverageBalancer balancer(SelectionConfig{});

    std::vector<Clip> clips;
    for (int i = 0; i < 10; ++i) {
        clips.push_back(make_clip("c" + std::to_string(i), i * 19.0, i * 19.0 + 10, 0.05 * i));
    }
    const auto outcome = balancer.balance(clips, 1000);
    EXPECT_TRUE(outcome.backfilled);
    ASSERT_EQ(outcome.clips.size(), 8u);
    EXPECT_EQ(outcome.clips.front().id, "c2");
    EXPECT_EQ(outcome.clips.back().id, "c9");
    for (std::size_t i = 1; i < outcome.clips.size(); ++i) {
        EXPECT_LE(outcome.clips[i - 1].t0, outcome.clips[i].t0);
    }
}

TEST(CoverageBalancer, UnknownSourceUsesLastClipEnd) {
    SelectionConfig config;
    config.minClips = 1;
    config.maxClipsPerBin = 1;
    const CoverageBalancer balancer(config);
    const auto outcome = balancer.balance(
        {make_clip("a", 0, 100, 0.5), make_clip("b", 150, 200, 0.9), make_clip("c", 900, 1000, 0.4)}, 0.0);
    ASSERT_EQ(outcome.clips.size(), 2u);
    EXPECT_EQ(outcome.clips[0].id, "b");
    EXPECT_EQ(outcome.clips[1].id, "c");
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Duration reconciler
// ═══════════════════════════════════════════════════════════════════════════════

TEST(DurationReconciler, TrimsThenDropsWeakest) {
    const DurationReconciler reconciler(SelectionConfig{});

    std::vector<Clip> clips;
    for (int i = 0; i < 10; ++i) {
        clips.push_back(make_clip("c" + std::to_string(i), i * 300.0, i * 300.0 + 117.0, 0.5 + 0.04 * i));
    }
    const auto outcome = reconciler.reconcile(clips, {});

    EXPECT_DOUBLE_EQ(outcome.totalBefore, 1170.0);
    EXPECT_EQ(outcome.trimmed, 10);
    EXPECT_EQ(outcome.dropped, 1);
    EXPECT_LE(outcome.totalAfter, 990.0 + 1e-9);
    ASSERT_EQ(outcome.clips.size(), 9u);
    EXPECT_EQ(outcome.clips.front().id, "c1");
    for (const auto &clip : outcome.clips) {
        EXPECT_NEAR(clip.duration, 117.0 * 0.85, 1e-9);
        EXPECT_GE(clip.duration, 10.0);
        EXPECT_DOUBLE_EQ(std::fmod(clip.t0, 300.0), 0.0);
    }
}

TEST(DurationReconciler, RefillsAfterTrimLeavesShortfall) {
    const DurationReconciler reconciler(SelectionConfig{});

    std::vector<Clip> clips;
    for (int i = 0; i < 10; ++i) {
        clips.push_back(make_clip("c" + std::to_string(i), i * 300.0, i * 300.0 + 117.0, 0.5 + 0.04 * i));
    }
    const std::vector<Clip> pool{
        clips[0],
        make_clip("wide", 5000, 5100, 0.99),
        make_clip("extra", 4000, 4060, 0.95),
    };
    const auto outcome = reconciler.reconcile(clips, pool);

    EXPECT_EQ(outcome.trimmed, 10);
    EXPECT_EQ(outcome.dropped, 1);
    EXPECT_EQ(outcome.added, 1);
    ASSERT_EQ(outcome.clips.size(), 10u);
    EXPECT_EQ(outcome.clips.front().id, "c1");
    EXPECT_EQ(outcome.clips.back().id, "extra");
    EXPECT_NEAR(outcome.totalAfter, 9 * 117.0 * 0.85 + 60.0, 1e-9);
    EXPECT_GE(outcome.totalAfter, 900.0);
    EXPECT_LE(outcome.totalAfter, 990.0 + 1e-9);
}

TEST(DurationReconciler, DropKeepsTargetWhenPossible) {
    SelectionConfig config;
    config.trimPercentage = 0.0;
    const DurationReconciler reconciler(config);

    const auto outcome = reconciler.reconcile(
        {make_clip("long", 0, 500, 0.3), make_clip("mid", 1000, 1400, 0.8), make_clip("small", 2000, 2150, 0.5)},
        {});
    EXPECT_EQ(outcome.dropped, 1);
    ASSERT_EQ(outcome.clips.size(), 2u);
    EXPECT_EQ(outcome.clips[0].id, "long");
    EXPECT_EQ(outcome.clips[1].id, "mid");
    EXPECT_DOUBLE_EQ(outcome.totalAfter, 900.0);
}

TEST(DurationReconciler, WithinSlackIsUntouched) {
    const DurationReconciler reconciler(SelectionConfig{});
    std::vector<Clip> clips;
    for (int i = 0; i < 10; ++i) {
        clips.push_back(make_clip("c" + std::to_string(i), i * 300.0, i * 300.0 + 100.0, 0.5));
    }
    EXPECT_FALSE(reconciler.needsTrim(1000.0));
    EXPECT_TRUE(reconciler.needsTrim(1036.0));

    const auto outcome = reconciler.reconcile(clips, {});
    EXPECT_EQ(outcome.trimmed, 0);
    EXPECT_EQ(outcome.added, 0);
    EXPECT_DOUBLE_EQ(outcome.totalAfter, 1000.0);
}

TEST(DurationReconciler, DropsClipsBelowGuard) {
    const DurationReconciler reconciler(SelectionConfig{});
    const auto outcome = reconciler.reconcile({make_clip("tiny", 0, 5, 0.9), make_clip("ok", 100, 1000, 0.5)}, {});
    EXPECT_EQ(outcome.dropped, 1);
    ASSERT_EQ(outcome.clips.size(), 1u);
    EXPECT_EQ(outcome.clips[0].id, "ok");
}

TEST(DurationReconciler, TopUpSkipsUsedAndConflictingClips) {
    const DurationReconciler reconciler(SelectionConfig{});

    auto containsA = merge_clips(make_clip("a", 5000, 5060, 0.99), make_clip("f", 5061, 5150, 0.99));
    const std::vector<Clip> pool{
        make_clip("a", 0, 100, 0.9),
        make_clip("b", 110, 230, 0.95),
        make_clip("c", 1000, 1120, 0.8),
        make_clip("d", 2000, 2120, 0.7),
        make_clip("e", 3000, 3020, 0.99),
        containsA,
    };
    const auto outcome = reconciler.reconcile({make_clip("a", 0, 100, 0.9)}, pool);

    EXPECT_EQ(outcome.added, 2);
    ASSERT_EQ(outcome.clips.size(), 3u);
    EXPECT_EQ(outcome.clips[0].id, "a");
    EXPECT_EQ(outcome.clips[1].id, "c");
    EXPECT_EQ(outcome.clips[2].id, "d");
}

TEST(DurationReconciler, TopUpNeverPassesCeiling) {
    SelectionConfig config;
    config.minClipDuration = 10;
    config.targetTotalDuration = 200;
    const DurationReconciler reconciler(config);

    const std::vector<Clip> pool{make_clip("big", 1000, 1140, 0.9), make_clip("fits", 2000, 2090, 0.6)};
    const auto outcome = reconciler.reconcile({make_clip("a", 0, 100, 0.9)}, pool);

    ASSERT_EQ(outcome.clips.size(), 2u);
    EXPECT_EQ(outcome.clips[1].id, "fits");
    EXPECT_LE(outcome.totalAfter, 200.0 * 1.15);
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Shorts
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ShortsSelector, PicksBestWithinDurationWindow) {
    ShortsConfig config;
    config.count = 3;
    const ShortsSelector shorts(config, 80.0);

    auto top = make_clip("top", 100, 130, 0.95);
    top.transcript = "one two three four five six seven eight nine ten eleven twelve";
    const std::vector<Clip> pool{
        make_clip("tiny", 0, 10, 0.99),   top,
        make_clip("hot", 200, 245, 0.85), make_clip("long", 300, 361, 0.99),
        make_clip("new", 400, 420, 0.75), make_clip("meh", 500, 550, 0.5),
    };
    const auto out = shorts.select(pool, 0.0);

    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].id, "top");
    EXPECT_EQ(out[0].clipId, "short_01");
    EXPECT_EQ(out[0].title, "[TOP] one two three four five six seven eight nine ten");
    EXPECT_EQ(out[1].id, "hot");
    EXPECT_EQ(out[1].title.rfind("[HOT] ", 0), 0u);
    EXPECT_EQ(out[2].id, "new");
    EXPECT_EQ(out[2].clipId, "short_03");
    EXPECT_EQ(out[2].title, "[NEW] Notable moment");
}

TEST(ShortsSelector, PercentileFallbackWhenThresholdTooHigh) {
    const ShortsSelector shorts(ShortsConfig{}, 80.0);
    std::vector<Clip> pool;
    for (int i = 1; i <= 5; ++i) pool.push_back(make_clip("c" + std::to_string(i), i * 100.0, i * 100.0 + 30, 0.1 * i));

    const auto out = shorts.select(pool, 0.99);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].id, "c5");
}

TEST(ShortsSelector, LongTitlesAreCut) {
    auto clip = make_clip("x", 0, 30, 0.1);
    clip.transcript = "supercalifragilistic expialidocious antidisestablishmentarianism floccinaucinihilipilification";
    const auto title = ShortsSelector::shortTitle(clip);
    EXPECT_EQ(utf8_length(title), 50u);
    EXPECT_EQ(title.substr(title.size() - 3), "...");
}
