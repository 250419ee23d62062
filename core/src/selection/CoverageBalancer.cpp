#include "reelcut/selection/CoverageBalancer.h"
#include "reelcut/CoreContract.h"
#include "reelcut/Logging.h"

#include <algorithm>
#include <cmath>

namespace reelcut {
namespace selection {

namespace {

std::vector<Clip> best_by_score(std::vector<Clip> clips, std::size_t count) {
    std::stable_sort(clips.begin(), clips.end(), [](const Clip& a, const Clip& b) { return a.t0 < b.t0; });
    std::stable_sort(clips.begin(), clips.end(),
                     [](const Clip& a, const Clip& b) { return a.finalScore > b.finalScore; });
    if (clips.size() > count) clips.resize(count);
    return clips;
}

}  // namespace

CoverageBalancer::CoverageBalancer(SelectionConfig config) : config_(std::move(config)) {}

int CoverageBalancer::binCapFor(double sourceDuration) const {
    int cap = config_.maxClipsPerBin;
    if (sourceDuration >= contract::COVERAGE_VERY_LONG_SEC) {
        cap = std::max(cap, contract::COVERAGE_BIN_CAP_VERY_LONG);
    } else if (sourceDuration >= contract::COVERAGE_LONG_SEC) {
        cap = std::max(cap, contract::COVERAGE_BIN_CAP_LONG);
    }
    return cap;
}

int CoverageBalancer::floorFor(double sourceDuration) const {
    int floor = config_.minClips;
    if (sourceDuration >= contract::COVERAGE_VERY_LONG_SEC) {
        floor = std::max(floor, contract::COVERAGE_FLOOR_VERY_LONG);
    } else if (sourceDuration >= contract::COVERAGE_LONG_SEC) {
        floor = std::max(floor, contract::COVERAGE_FLOOR_LONG);
    }
    return floor;
}

int CoverageBalancer::binIndex(double t0, double sourceDuration) const {
    const int bins = std::max(1, config_.positionBins);
    if (sourceDuration <= 0.0) return 0;
    const double binSize = sourceDuration / bins;
    const double idx = std::floor(t0 / binSize);
    if (!(idx > 0.0)) return 0;
    return static_cast<int>(std::min(idx, static_cast<double>(bins - 1)));
}

BalanceOutcome CoverageBalancer::balance(const std::vector<Clip>& clips, double sourceDuration) const {
    BalanceOutcome outcome;
    if (sourceDuration <= 0.0) {
        for (const auto& clip : clips) sourceDuration = std::max(sourceDuration, clip.t1);
    }
    outcome.binCap = binCapFor(sourceDuration);
    outcome.floor = floorFor(sourceDuration);

    const int bins = std::max(1, config_.positionBins);
    std::vector<std::vector<Clip>> binned(static_cast<std::size_t>(bins));
    for (const auto& clip : clips) {
        binned[static_cast<std::size_t>(binIndex(clip.t0, sourceDuration))].push_back(clip);
    }

    for (std::size_t b = 0; b < binned.size(); ++b) {
        auto kept = best_by_score(binned[b], static_cast<std::size_t>(outcome.binCap));
        if (kept.size() < binned[b].size()) {
            REELCUT_LOG_DEBUG("Bin " << b << " capped: " << binned[b].size() << " -> " << kept.size());
        }
        outcome.clips.insert(outcome.clips.end(), kept.begin(), kept.end());
    }

    if (static_cast<int>(outcome.clips.size()) < outcome.floor && outcome.clips.size() < clips.size()) {
        REELCUT_LOG_INFO("Coverage balance left " << outcome.clips.size() << " clips (floor " << outcome.floor
                         << "); backfilling from all " << clips.size() << " candidates");
        outcome.clips = best_by_score(clips, static_cast<std::size_t>(outcome.floor));
        outcome.backfilled = true;
    }

    std::stable_sort(outcome.clips.begin(), outcome.clips.end(),
                     [](const Clip& a, const Clip& b) { return a.t0 < b.t0; });
    return outcome;
}

}  // namespace selection
}  // namespace reelcut
