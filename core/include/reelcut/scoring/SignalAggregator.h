#pragma once

#include "../ClipTypes.h"
#include "../Config.h"
#include "Collaborators.h"
#include "ScoringStrategy.h"

#include <cstddef>
#include <string>
#include <vector>

namespace reelcut {
namespace scoring {

struct ScoringContext {
    double sourceDuration{0.0};          // <= 0 when unknown
    const ChatHistogram* chat{nullptr};  // may be null or empty
    std::string prompt;
};

struct AggregationReport {
    std::vector<Segment> segments;       // accepted input, scored, chronological
    WeightProfile weights;               // effective profile
    bool chatAvailable{false};
    int rejected{0};                     // malformed input segments
    int candidates{0};                   // segments sent for semantic scoring
    int failedBatches{0};
};

/**
 * SignalAggregator: composite scoring of transcribed segments
 *
 * Combines acoustic, semantic, chat-burst and prompt-similarity subscores under
 * the strategy's weight profile:
 *   final = clamp(sum(subscore * weight)) * (1 + bonus * (1 - |pos - 0.5|))
 *
 * Only the prefiltered candidate subset (top-N by pre-score plus forced keyword
 * hits) is sent to the semantic assessor, in fixed-size batches.
 */
class SignalAggregator {
  public:
    explicit SignalAggregator(ScoringConfig config,
                              SemanticAssessor* assessor = nullptr,
                              const PromptSimilarity* promptSimilarity = nullptr);

    AggregationReport score(const std::vector<Segment>& segments,
                            const ScoringStrategy& strategy,
                            const ScoringContext& context) const;

    static double acoustic_score(const Segment& segment);
    static double keyword_score(const Segment& segment);
    static double composite(const Subscores& subscores, const WeightProfile& weights);

    // Indices (into a chronological list) of the segments that get a semantic score.
    std::vector<std::size_t> select_candidates(const std::vector<Segment>& segments) const;

    double position_factor(const Segment& segment, double sourceDuration) const;

  private:
    void assign_semantic(std::vector<Segment>& segments,
                         const std::vector<std::size_t>& candidates,
                         AggregationReport& report) const;

    ScoringConfig config_;
    SemanticAssessor* assessor_{nullptr};
    const PromptSimilarity* promptSimilarity_{nullptr};
};

}  // namespace scoring
}  // namespace reelcut
