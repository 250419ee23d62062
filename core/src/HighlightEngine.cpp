#include "reelcut/HighlightEngine.h"
#include "reelcut/Logging.h"
#include "reelcut/Utility.h"
#include "reelcut/planning/PartPlanner.h"
#include "reelcut/planning/Schedule.h"
#include "reelcut/planning/TitleGenerator.h"
#include "reelcut/scoring/SignalAggregator.h"
#include "reelcut/selection/CandidateSelector.h"
#include "reelcut/selection/CoverageBalancer.h"
#include "reelcut/selection/DurationReconciler.h"
#include "reelcut/selection/ShortsSelector.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace reelcut {

namespace {

bool cancelled(const CancellationToken* token, RunResult& result, const char* stage) {
    if (token && token->cancelled()) {
        REELCUT_LOG_INFO("Run " << result.runId << " cancelled before " << stage);
        result.status = RunStatus::Cancelled;
        result.scored.clear();
        result.clips.clear();
        result.shorts.clear();
        result.plan.reset();
        return true;
    }
    return false;
}

double derive_source_duration(const std::vector<Segment>& segments) {
    double end = 0.0;
    for (const auto& seg : segments) {
        if (std::isfinite(seg.t1)) end = std::max(end, seg.t1);
    }
    return end;
}

void number_clips(std::vector<Clip>& clips) {
    for (std::size_t i = 0; i < clips.size(); ++i) {
        char id[16];
        std::snprintf(id, sizeof(id), "clip_%03zu", i + 1);
        clips[i].clipId = id;
        clips[i].title = planning::TitleGenerator::clipTitle(clips[i]);
    }
}

}  // namespace

HighlightEngine::HighlightEngine(PipelineConfig config,
                                 scoring::SemanticAssessor* assessor,
                                 const scoring::PromptSimilarity* promptSimilarity,
                                 const std::string& databasePath)
    : config_(std::move(config)), assessor_(assessor), promptSimilarity_(promptSimilarity) {
    config_.validate();
    strategy_ = scoring::make_scoring_strategy(config_.mode, config_.weightOverride);
    if (!databasePath.empty()) {
        store_ = std::make_unique<SQLiteStore>(databasePath);
        store_->initialize();
    }
}

RunResult HighlightEngine::run(const HighlightRequest& request, const CancellationToken* cancel) {
    RunLease lease(handle_);
    if (!lease.acquired()) {
        REELCUT_LOG_WARN("Run " << request.runId << " refused: another run is in progress");
        RunResult busy;
        busy.runId = request.runId;
        busy.mode = config_.mode;
        busy.status = RunStatus::Busy;
        return busy;
    }
    return execute(request, cancel);
}

RunResult HighlightEngine::execute(const HighlightRequest& request, const CancellationToken* cancel) {
    RunResult result;
    result.runId = request.runId.empty() ? "run" : request.runId;
    result.mode = config_.mode;
    result.sourceDuration = request.sourceDuration > 0.0 ? request.sourceDuration : derive_source_duration(request.segments);

    // Step 1: Split plan, fixed for the rest of the run
    SelectionConfig selectionConfig = config_.selection;
    double shortsMinScore = 0.0;
    const planning::PartPlanner planner(config_.splitter);
    if (config_.splitter.enabled && result.sourceDuration >= config_.splitter.minDurationForSplit) {
        result.plan = planner.calculateSplitStrategy(result.sourceDuration);
        selectionConfig.targetTotalDuration = result.plan->totalTargetDuration;
        selectionConfig.minScoreThreshold = std::max(selectionConfig.minScoreThreshold, result.plan->minScoreThreshold);
        shortsMinScore = result.plan->minScoreThreshold;
        result.notes.push_back("split plan: " + result.plan->reason);
    }
    if (cancelled(cancel, result, "scoring")) return result;

    // Step 2: Composite scoring
    const scoring::SignalAggregator aggregator(config_.scoring, assessor_, promptSimilarity_);
    scoring::ScoringContext context;
    context.sourceDuration = result.sourceDuration;
    context.chat = &request.chat;
    context.prompt = request.prompt;
    auto report = aggregator.score(request.segments, *strategy_, context);
    result.weights = report.weights;
    result.rejectedSegments = report.rejected;
    if (report.failedBatches > 0) {
        result.notes.push_back(std::to_string(report.failedBatches) + " semantic batches failed; neutral score used");
    }
    if (report.segments.empty()) {
        REELCUT_LOG_WARN("Run " << result.runId << ": no usable segments");
        result.status = RunStatus::NoCandidates;
        result.plan.reset();
        return result;
    }
    result.scored = std::move(report.segments);
    if (cancelled(cancel, result, "selection")) return result;

    // Step 3: Candidate selection
    const selection::CandidateSelector selector(selectionConfig);
    auto selected = selector.select(result.scored);
    result.notes.insert(result.notes.end(), selected.notes.begin(), selected.notes.end());
    if (cancelled(cancel, result, "coverage balancing")) return result;

    // Step 4: Coverage balancing
    const selection::CoverageBalancer balancer(selectionConfig);
    auto balanced = balancer.balance(selected.clips, result.sourceDuration);
    if (balanced.backfilled) {
        result.notes.push_back("coverage floor " + std::to_string(balanced.floor) + " not met; backfilled by score");
    }
    if (cancelled(cancel, result, "duration reconciliation")) return result;

    // Step 5: Duration reconciliation
    const selection::DurationReconciler reconciler(selectionConfig);
    auto reconciled = reconciler.reconcile(balanced.clips, selected.pool);
    result.notes.insert(result.notes.end(), reconciled.notes.begin(), reconciled.notes.end());
    if (cancelled(cancel, result, "part planning")) return result;

    result.clips = std::move(reconciled.clips);
    number_clips(result.clips);

    // Step 6: Shorts candidates
    if (config_.shorts.enabled) {
        const selection::ShortsSelector shorts(config_.shorts, selectionConfig.fallbackPercentile);
        result.shorts = shorts.select(selected.pool, shortsMinScore);
    }

    // Step 7: Parts, schedule and titles
    if (result.plan) {
        const planning::TitleGenerator titles(config_.titles, strategy_->titleContext(config_.titles));
        const auto base = request.baseDate ? *request.baseDate : planning::today();
        planner.planParts(*result.plan, result.clips, base, titles);
    }
    if (cancelled(cancel, result, "storage")) return result;

    // Step 8: Store results
    result.status = RunStatus::Completed;
    if (store_) {
        store_->save_run(result);
    }

    REELCUT_LOG_INFO("Run " << result.runId << " completed: " << result.clips.size() << " clips, "
                     << format_duration(total_duration(result.clips)) << ", " << result.shorts.size() << " shorts");
    return result;
}

}  // namespace reelcut
