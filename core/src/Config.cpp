#include "reelcut/Config.h"

#include <cmath>
#include <sstream>

namespace reelcut {

namespace {

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigError("Invalid configuration: " + message);
    }
}

void require_weight(double value, const char* name) {
    std::ostringstream msg;
    msg << "weight " << name << " must be a non-negative finite number (got " << value << ")";
    require(std::isfinite(value) && value >= 0.0, msg.str());
}

}  // namespace

void PipelineConfig::validate() const {
    const auto& s = selection;
    require(s.minClipDuration > 0.0, "min_clip_duration must be positive");
    require(s.minClipDuration < s.maxClipDuration, "min_clip_duration must be below max_clip_duration");
    require(s.minClips >= 1, "min_clips must be at least 1");
    require(s.maxClips >= 1, "max_clips must be at least 1");
    require(s.targetTotalDuration >= s.minClipDuration * s.minClips,
            "target_total_duration must cover min_clips clips of min_clip_duration");
    require(s.minScoreThreshold >= 0.0 && s.minScoreThreshold <= 1.0, "min_score_threshold must lie in [0,1]");
    require(s.fallbackPercentile >= 1.0 && s.fallbackPercentile <= 99.0, "fallback_percentile must lie in [1,99]");
    require(s.relaxStep >= 0.0, "relax_step must be non-negative");
    require(s.minTimeGap >= 0.0, "min_time_gap must be non-negative");
    require(s.minSegmentDuration >= 0.0 && s.burstMergeGap >= 0.0, "burst merge limits must be non-negative");
    require(s.smartMergeGap >= 0.0, "smart_merge_gap must be non-negative");
    require(s.positionBins >= 1, "position_bins must be at least 1");
    require(s.maxClipsPerBin >= 1, "max_clips_per_bin must be at least 1");
    require(s.durationTolerance >= 1.0, "duration_tolerance must be at least 1.0");
    require(s.trimPercentage >= 0.0 && s.trimPercentage < 1.0, "trim_percentage must lie in [0,1)");
    require(s.minDurationGuard >= 0.0 && s.minDurationGuard < s.maxClipDuration,
            "min_duration_guard must lie in [0, max_clip_duration)");
    require(s.topUpHardCap >= 1, "top_up_hard_cap must be at least 1");

    require(scoring.prefilterTopN >= 1, "prefilter_top_n must be at least 1");
    require(scoring.semanticBatchSize >= 1, "semantic_batch_size must be at least 1");
    require(scoring.neutralSemanticScore >= 0.0 && scoring.neutralSemanticScore <= 1.0,
            "neutral_semantic_score must lie in [0,1]");
    require(scoring.diversityBonus >= 0.0, "diversity_bonus must be non-negative");
    require(scoring.chatBaselineWindow > 0.0 && scoring.chatPeakExtension >= 0.0, "chat windows must be positive");

    if (weightOverride) {
        require_weight(weightOverride->chatBurst, "chat_burst");
        require_weight(weightOverride->acoustic, "acoustic");
        require_weight(weightOverride->semantic, "semantic");
        require_weight(weightOverride->promptBoost, "prompt_boost");
    }

    require(shorts.count >= 0, "shorts.count must be non-negative");
    require(shorts.minDuration > 0.0 && shorts.minDuration < shorts.maxDuration, "shorts duration bounds are inverted");

    require(splitter.publishHour >= 0 && splitter.publishHour <= 23, "publish_hour must lie in [0,23]");
    require(splitter.publishMinute >= 0 && splitter.publishMinute <= 59, "publish_minute must lie in [0,59]");
    require(splitter.firstPublishDayOffset >= 0, "first_publish_day_offset must be non-negative");
    require(!splitter.overrideParts || *splitter.overrideParts >= 1, "override_parts must be at least 1");
    require(!splitter.overrideTargetMinutes || *splitter.overrideTargetMinutes >= 1,
            "override_target_minutes must be at least 1");
}

}  // namespace reelcut
