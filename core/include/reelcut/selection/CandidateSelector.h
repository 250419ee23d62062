#pragma once

#include "../ClipTypes.h"
#include "../Config.h"

#include <string>
#include <vector>

namespace reelcut {
namespace selection {

struct SelectionOutcome {
    std::vector<Clip> clips;            // accepted and merged, chronological
    std::vector<Clip> pool;             // after short-burst merge, before any filter
    double threshold{0.0};              // score threshold finally applied
    bool percentileFallback{false};
    bool relaxed{false};
    bool forceMerged{false};
    std::vector<std::string> notes;
};

// Merged span covers both clips; score and subscores are the mean over constituents.
Clip merge_clips(const Clip& first, const Clip& second);

// True when the clips overlap, touch, or sit closer than minGap.
bool conflicts(const Clip& a, const Clip& b, double minGap);

/**
 * CandidateSelector: scored segments -> non-overlapping, duration-bounded clips
 *
 * Stages, in order:
 *   1. short-burst merge of segments below minSegmentDuration
 *   2. score filter (percentile fallback when nothing passes)
 *   3. duration filter (one threshold relaxation when the pool is thin)
 *   4. greedy selection by score with temporal suppression
 *   5. gap-inclusive smart merge, plus one force-merge pass on low coverage
 *
 * Each stage returns a fresh list.
 */
class CandidateSelector {
  public:
    explicit CandidateSelector(SelectionConfig config);

    SelectionOutcome select(const std::vector<Segment>& scored) const;

    std::vector<Clip> mergeShortBursts(std::vector<Clip> clips) const;
    std::vector<Clip> filterByScore(const std::vector<Clip>& pool, double threshold, bool& usedFallback) const;
    std::vector<Clip> filterByDuration(const std::vector<Clip>& pool) const;
    std::vector<Clip> suppressOverlaps(const std::vector<Clip>& candidates) const;
    std::vector<Clip> smartMerge(const std::vector<Clip>& accepted, double maxDuration) const;

  private:
    SelectionConfig config_;
};

}  // namespace selection
}  // namespace reelcut
