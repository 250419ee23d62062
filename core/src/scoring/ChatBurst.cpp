#include "reelcut/scoring/ChatBurst.h"
#include "reelcut/CoreContract.h"

#include <algorithm>
#include <cmath>

namespace reelcut {
namespace scoring {

namespace {

int to_second(double t) {
    if (!(t > 0.0)) return 0;
    return static_cast<int>(std::min(t, static_cast<double>(contract::CHAT_MAX_SECOND)));
}

int to_window(double seconds, double floor) {
    if (!(seconds > floor)) return static_cast<int>(floor);
    return static_cast<int>(std::min(seconds, contract::CHAT_MAX_WINDOW_SEC));
}

}  // namespace

ChatBurstScorer::ChatBurstScorer(const ChatHistogram& histogram, double baselineWindowSec, double peakExtensionSec)
    : histogram_(histogram),
      baselineWindow_(to_window(baselineWindowSec, 1.0)),
      peakExtension_(to_window(peakExtensionSec, 0.0)) {}

int ChatBurstScorer::sum_range(int fromSec, int toSecExclusive) const {
    int total = 0;
    for (auto it = histogram_.lower_bound(fromSec); it != histogram_.end() && it->first < toSecExclusive; ++it) {
        total += it->second;
    }
    return total;
}

int ChatBurstScorer::max_range(int fromSec, int toSecInclusive) const {
    int peak = 0;
    for (auto it = histogram_.lower_bound(fromSec); it != histogram_.end() && it->first <= toSecInclusive; ++it) {
        peak = std::max(peak, it->second);
    }
    return peak;
}

ChatWindowStats ChatBurstScorer::measure(double t0, double t1) const {
    const int segStart = to_second(t0);
    const int segEnd = std::max(segStart, to_second(t1));

    const int baselineStart = std::max(0, segStart - baselineWindow_);
    const int baselineSpan = std::max(segStart - baselineStart, 1);

    ChatWindowStats stats;
    stats.baselineRate = static_cast<double>(sum_range(baselineStart, segStart)) / baselineSpan;
    stats.peak = max_range(segStart, segEnd + peakExtension_);
    stats.multiplier = static_cast<double>(stats.peak) / std::max(stats.baselineRate, contract::CHAT_BASELINE_MIN_RATE);
    return stats;
}

double ChatBurstScorer::score(double t0, double t1) const {
    if (!available()) return 0.0;
    return bucket_score(measure(t0, t1).multiplier);
}

double ChatBurstScorer::bucket_score(double multiplier) {
    for (const auto& bucket : contract::CHAT_BURST_BUCKETS) {
        if (multiplier >= bucket.minMultiplier) return bucket.score;
    }
    return contract::CHAT_BURST_FLOOR_SCORE;
}

}  // namespace scoring
}  // namespace reelcut
