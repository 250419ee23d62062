#pragma once

#include "../ClipTypes.h"

namespace reelcut {
namespace scoring {

struct ChatWindowStats {
    double baselineRate{0.0};   // messages per second before the segment
    int peak{0};                // busiest second inside the segment plus extension
    double multiplier{0.0};     // peak / max(baselineRate, 1)
};

/**
 * ChatBurstScorer: chat-activity burst signal for a time window
 *
 * Baseline is the mean rate over the trailing window before the segment start;
 * peak is the maximum per-second count over [start, end + extension], both ends
 * inclusive, on whole seconds. The scorer borrows the histogram, which must
 * outlive it.
 */
class ChatBurstScorer {
  public:
    ChatBurstScorer(const ChatHistogram& histogram, double baselineWindowSec, double peakExtensionSec);

    bool available() const { return !histogram_.empty(); }

    ChatWindowStats measure(double t0, double t1) const;

    // 0.0 when no chat data exists at all.
    double score(double t0, double t1) const;

    static double bucket_score(double multiplier);

  private:
    int sum_range(int fromSec, int toSecExclusive) const;
    int max_range(int fromSec, int toSecInclusive) const;

    const ChatHistogram& histogram_;
    int baselineWindow_{180};
    int peakExtension_{10};
};

}  // namespace scoring
}  // namespace reelcut
