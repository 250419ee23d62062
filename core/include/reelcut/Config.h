#pragma once

#include "reelcut/ClipTypes.h"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace reelcut {

/**
 * ConfigError: invalid pipeline configuration.
 *
 * Thrown by PipelineConfig::validate() before any segment is processed.
 */
class ConfigError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

struct ScoringConfig {
    int prefilterTopN{40};
    double keywordForceThreshold{5.0};  // raw keyword_score that bypasses the top-N cut
    int semanticBatchSize{10};
    double neutralSemanticScore{0.5};   // assigned to every segment of a failed batch
    std::size_t transcriptCharLimit{400};
    double diversityBonus{0.1};
    double chatBaselineWindow{180.0};   // seconds before the segment
    double chatPeakExtension{10.0};     // seconds after the segment
};

struct SelectionConfig {
    // short-burst merge
    double minSegmentDuration{8.0};
    double burstMergeGap{5.0};

    // duration and count budget
    double minClipDuration{90.0};
    double maxClipDuration{180.0};
    double targetTotalDuration{900.0};
    int minClips{8};
    int maxClips{15};

    // score filter
    double minScoreThreshold{0.25};
    double fallbackPercentile{80.0};
    double relaxStep{0.10};
    int relaxMinPoolSize{30};
    double relaxMinCoverage{0.5};       // fraction of target

    // non-maximum suppression
    double minTimeGap{30.0};
    double overshootCeiling{1.2};       // fraction of target

    // smart merge
    double smartMergeGap{5.0};
    double smartMergeMinScore{0.6};
    double forceMergeCoverage{0.7};     // fraction of target
    double forceMergeCeiling{1.1};      // fraction of maxClipDuration

    // coverage balancing
    int positionBins{5};
    int maxClipsPerBin{4};

    // duration reconciliation
    double durationTolerance{1.1};
    double trimTriggerSlack{0.05};      // fraction of target
    double trimPercentage{0.15};
    double minDurationGuard{10.0};
    int topUpHardCap{40};
    double topUpMinDurationFactor{0.6};
    double topUpCeiling{1.15};          // fraction of target
};

struct ShortsConfig {
    bool enabled{true};
    int count{10};
    double minDuration{15.0};
    double maxDuration{60.0};
};

struct SplitterConfig {
    bool enabled{true};
    double minDurationForSplit{3600.0};
    std::optional<int> overrideParts;
    std::optional<int> overrideTargetMinutes;
    int publishHour{18};
    int publishMinute{0};
    int firstPublishDayOffset{1};
};

struct TitleConfig {
    std::string politicalContext{"Parliament Session"};
    std::string streamContext{"Stream Highlights"};
    std::vector<std::string> entityNames;  // matched case-insensitively as substrings
};

struct PipelineConfig {
    ProcessingMode mode{ProcessingMode::PoliticalSession};
    std::optional<WeightProfile> weightOverride;
    ScoringConfig scoring;
    SelectionConfig selection;
    ShortsConfig shorts;
    SplitterConfig splitter;
    TitleConfig titles;

    /** Throws ConfigError naming the first offending field. */
    void validate() const;
};

}  // namespace reelcut
