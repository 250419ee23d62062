#include "reelcut/selection/DurationReconciler.h"
#include "reelcut/selection/CandidateSelector.h"
#include "reelcut/Logging.h"
#include "reelcut/Utility.h"

#include <algorithm>
#include <numeric>
#include <sstream>
#include <unordered_set>

namespace reelcut {
namespace selection {

namespace {

void sort_chronologically(std::vector<Clip>& clips) {
    std::stable_sort(clips.begin(), clips.end(), [](const Clip& a, const Clip& b) { return a.t0 < b.t0; });
}

std::unordered_set<std::string> constituent_ids(const std::vector<Clip>& clips) {
    std::unordered_set<std::string> ids;
    for (const auto& clip : clips) {
        ids.insert(clip.id);
        ids.insert(clip.mergedFrom.begin(), clip.mergedFrom.end());
    }
    return ids;
}

bool shares_constituent(const Clip& clip, const std::unordered_set<std::string>& ids) {
    if (ids.count(clip.id) > 0) return true;
    return std::any_of(clip.mergedFrom.begin(), clip.mergedFrom.end(),
                       [&](const std::string& id) { return ids.count(id) > 0; });
}

}  // namespace

DurationReconciler::DurationReconciler(SelectionConfig config) : config_(std::move(config)) {}

bool DurationReconciler::needsTrim(double total) const {
    const double target = config_.targetTotalDuration;
    return total > target * config_.durationTolerance + config_.trimTriggerSlack * target;
}

std::vector<Clip> DurationReconciler::trim(const std::vector<Clip>& clips, int& trimmed, int& dropped) const {
    std::vector<Clip> out = clips;
    const double target = config_.targetTotalDuration;
    const double guard = config_.minDurationGuard;

    double remaining = total_duration(out) - target;

    std::vector<std::size_t> order(out.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](std::size_t a, std::size_t b) { return out[a].duration > out[b].duration; });

    for (std::size_t idx : order) {
        if (remaining <= 0.0) break;
        Clip& clip = out[idx];
        const double cut = std::min({config_.trimPercentage * clip.duration, clip.duration - guard, remaining});
        if (cut <= 0.0) continue;
        clip.t1 -= cut;
        clip.duration = clip.t1 - clip.t0;
        remaining -= cut;
        ++trimmed;
        REELCUT_LOG_DEBUG("Trimmed " << cut << "s from " << clip.id);
    }

    // Per-clip caps exhausted: drop clips until within tolerance. The weakest clip whose
    // removal keeps the total at or above target goes first, else the weakest overall.
    const double limit = target * config_.durationTolerance;
    double total = total_duration(out);
    while (total > limit && out.size() > 1) {
        const auto weaker = [](const Clip& a, const Clip& b) { return a.finalScore < b.finalScore; };
        auto weakest = out.end();
        for (auto it = out.begin(); it != out.end(); ++it) {
            if (total - it->duration >= target && (weakest == out.end() || weaker(*it, *weakest))) {
                weakest = it;
            }
        }
        if (weakest == out.end()) {
            weakest = std::min_element(out.begin(), out.end(), weaker);
        }
        REELCUT_LOG_DEBUG("Dropping " << weakest->id << " (score " << weakest->finalScore << ") to meet budget");
        total -= weakest->duration;
        out.erase(weakest);
        ++dropped;
    }
    return out;
}

std::vector<Clip> DurationReconciler::topUp(const std::vector<Clip>& clips,
                                            const std::vector<Clip>& pool,
                                            int& added,
                                            double ceiling) const {
    std::vector<Clip> out = clips;
    const double target = config_.targetTotalDuration;
    const double minDuration = std::max(config_.minClipDuration * config_.topUpMinDurationFactor, config_.minDurationGuard);

    double total = total_duration(out);
    if (total >= target || static_cast<int>(out.size()) >= config_.topUpHardCap) {
        return out;
    }

    const auto used = constituent_ids(clips);
    std::vector<Clip> candidates;
    for (const auto& clip : pool) {
        if (clip.duration < minDuration || clip.duration > config_.maxClipDuration) continue;
        if (shares_constituent(clip, used)) continue;
        candidates.push_back(clip);
    }
    sort_chronologically(candidates);
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Clip& a, const Clip& b) { return a.finalScore > b.finalScore; });

    for (const auto& clip : candidates) {
        if (total >= target || static_cast<int>(out.size()) >= config_.topUpHardCap) break;
        if (total + clip.duration > ceiling) continue;
        const bool blocked = std::any_of(out.begin(), out.end(), [&](const Clip& kept) {
            return conflicts(kept, clip, config_.minTimeGap);
        });
        if (blocked) continue;
        out.push_back(clip);
        total += clip.duration;
        ++added;
        REELCUT_LOG_DEBUG("Top-up added " << clip.id << " (" << clip.duration << "s)");
    }
    return out;
}

ReconcileOutcome DurationReconciler::reconcile(const std::vector<Clip>& clips, const std::vector<Clip>& pool) const {
    ReconcileOutcome outcome;
    outcome.totalBefore = total_duration(clips);

    std::vector<Clip> working;
    working.reserve(clips.size());
    for (const auto& clip : clips) {
        if (clip.duration < config_.minDurationGuard) {
            REELCUT_LOG_DEBUG("Dropping " << clip.id << ": shorter than the " << config_.minDurationGuard << "s guard");
            ++outcome.dropped;
            continue;
        }
        working.push_back(clip);
    }

    if (needsTrim(total_duration(working))) {
        working = trim(working, outcome.trimmed, outcome.dropped);
        std::ostringstream note;
        note << "over budget by " << format_duration(outcome.totalBefore - config_.targetTotalDuration) << "; trimmed "
             << outcome.trimmed << " clips, dropped " << outcome.dropped;
        outcome.notes.push_back(note.str());
    }

    if (total_duration(working) < config_.targetTotalDuration) {
        // Clips dropped above are not offered again. After a trim the refill stays within tolerance.
        const auto inputIds = constituent_ids(clips);
        std::vector<Clip> fresh;
        for (const auto& clip : pool) {
            if (!shares_constituent(clip, inputIds)) fresh.push_back(clip);
        }
        const double factor = outcome.trimmed > 0 || outcome.dropped > 0
                                   ? std::min(config_.topUpCeiling, config_.durationTolerance)
                                   : config_.topUpCeiling;
        working = topUp(working, fresh, outcome.added, config_.targetTotalDuration * factor);
        if (outcome.added > 0) {
            outcome.notes.push_back("under budget; added " + std::to_string(outcome.added) + " clips from the pool");
        }
    }

    sort_chronologically(working);
    outcome.clips = std::move(working);
    outcome.totalAfter = total_duration(outcome.clips);
    REELCUT_LOG_INFO("Reconciled duration " << format_duration(outcome.totalBefore) << " -> "
                     << format_duration(outcome.totalAfter) << " (target "
                     << format_duration(config_.targetTotalDuration) << ")");
    return outcome;
}

}  // namespace selection
}  // namespace reelcut
