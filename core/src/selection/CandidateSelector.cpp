#include "reelcut/selection/CandidateSelector.h"
#include "reelcut/Logging.h"
#include "reelcut/Normalization.h"
#include "reelcut/Utility.h"

#include <algorithm>
#include <sstream>

namespace reelcut {
namespace selection {

namespace {

void sort_chronologically(std::vector<Clip>& clips) {
    std::stable_sort(clips.begin(), clips.end(), [](const Clip& a, const Clip& b) { return a.t0 < b.t0; });
}

double weighted_mean(double a, std::size_t na, double b, std::size_t nb) {
    const double n = static_cast<double>(na + nb);
    return (a * static_cast<double>(na) + b * static_cast<double>(nb)) / n;
}

std::vector<Keyword> union_keywords(const std::vector<Keyword>& a, const std::vector<Keyword>& b) {
    std::vector<Keyword> out = a;
    for (const auto& kw : b) {
        auto it = std::find_if(out.begin(), out.end(), [&](const Keyword& k) { return k.token == kw.token; });
        if (it == out.end()) {
            out.push_back(kw);
        } else {
            it->weight = std::max(it->weight, kw.weight);
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const Keyword& x, const Keyword& y) { return x.weight > y.weight; });
    return out;
}

}  // namespace

Clip merge_clips(const Clip& first, const Clip& second) {
    const std::size_t na = std::max<std::size_t>(1, first.mergedFrom.size());
    const std::size_t nb = std::max<std::size_t>(1, second.mergedFrom.size());

    Clip merged;
    merged.id = first.id + "+" + second.id;
    merged.t0 = std::min(first.t0, second.t0);
    merged.t1 = std::max(first.t1, second.t1);
    merged.duration = merged.t1 - merged.t0;
    merged.finalScore = weighted_mean(first.finalScore, na, second.finalScore, nb);

    merged.subscores.acoustic = weighted_mean(first.subscores.acoustic, na, second.subscores.acoustic, nb);
    merged.subscores.keyword = weighted_mean(first.subscores.keyword, na, second.subscores.keyword, nb);
    merged.subscores.semantic = weighted_mean(first.subscores.semantic, na, second.subscores.semantic, nb);
    merged.subscores.chatBurst = weighted_mean(first.subscores.chatBurst, na, second.subscores.chatBurst, nb);
    merged.subscores.promptSimilarity =
        weighted_mean(first.subscores.promptSimilarity, na, second.subscores.promptSimilarity, nb);

    if (first.transcript.empty() || second.transcript.empty()) {
        merged.transcript = first.transcript + second.transcript;
    } else {
        merged.transcript = first.transcript + " " + second.transcript;
    }

    merged.features = first.features;
    for (const auto& [key, value] : second.features) {
        auto it = merged.features.find(key);
        if (it == merged.features.end()) {
            merged.features.emplace(key, value);
        } else {
            it->second = weighted_mean(it->second, na, value, nb);
        }
    }

    merged.keywords = union_keywords(first.keywords, second.keywords);
    merged.mergedFrom = first.mergedFrom.empty() ? std::vector<std::string>{first.id} : first.mergedFrom;
    if (second.mergedFrom.empty()) {
        merged.mergedFrom.push_back(second.id);
    } else {
        merged.mergedFrom.insert(merged.mergedFrom.end(), second.mergedFrom.begin(), second.mergedFrom.end());
    }
    return merged;
}

bool conflicts(const Clip& a, const Clip& b, double minGap) {
    if (a.t0 <= b.t1 && b.t0 <= a.t1) {
        return true;  // overlapping or touching
    }
    const double gap = (a.t1 < b.t0) ? (b.t0 - a.t1) : (a.t0 - b.t1);
    return gap < minGap;
}

CandidateSelector::CandidateSelector(SelectionConfig config) : config_(std::move(config)) {}

std::vector<Clip> CandidateSelector::mergeShortBursts(std::vector<Clip> clips) const {
    sort_chronologically(clips);

    std::vector<Clip> out;
    out.reserve(clips.size());
    std::size_t i = 0;
    while (i < clips.size()) {
        Clip current = clips[i];
        std::size_t j = i + 1;
        while (current.duration < config_.minSegmentDuration && j < clips.size()
               && clips[j].t0 - current.t1 <= config_.burstMergeGap) {
            current = merge_clips(current, clips[j]);
            ++j;
        }
        // Still short with nothing ahead: fold into the previous output if it is close enough.
        if (current.duration < config_.minSegmentDuration && !out.empty()
            && current.t0 - out.back().t1 <= config_.burstMergeGap) {
            out.back() = merge_clips(out.back(), current);
        } else {
            out.push_back(std::move(current));
        }
        i = j;
    }
    return out;
}

std::vector<Clip> CandidateSelector::filterByScore(const std::vector<Clip>& pool,
                                                   double threshold,
                                                   bool& usedFallback) const {
    usedFallback = false;
    std::vector<Clip> kept;
    for (const auto& clip : pool) {
        if (clip.finalScore >= threshold) kept.push_back(clip);
    }
    if (!kept.empty() || pool.empty()) {
        return kept;
    }

    usedFallback = true;
    std::vector<double> scores;
    scores.reserve(pool.size());
    for (const auto& clip : pool) scores.push_back(clip.finalScore);
    const double cut = percentile(scores, config_.fallbackPercentile);
    REELCUT_LOG_WARN("No segment reached threshold " << threshold << "; using p" << config_.fallbackPercentile
                     << " cut " << cut);

    for (const auto& clip : pool) {
        if (clip.finalScore >= cut) kept.push_back(clip);
    }
    if (kept.empty()) {
        kept.push_back(*std::max_element(pool.begin(), pool.end(), [](const Clip& a, const Clip& b) {
            return a.finalScore < b.finalScore;
        }));
    }
    return kept;
}

std::vector<Clip> CandidateSelector::filterByDuration(const std::vector<Clip>& pool) const {
    std::vector<Clip> kept;
    for (const auto& clip : pool) {
        if (clip.duration >= config_.minClipDuration && clip.duration <= config_.maxClipDuration) {
            kept.push_back(clip);
        }
    }
    return kept;
}

std::vector<Clip> CandidateSelector::suppressOverlaps(const std::vector<Clip>& candidates) const {
    std::vector<Clip> ranked = candidates;
    sort_chronologically(ranked);
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const Clip& a, const Clip& b) { return a.finalScore > b.finalScore; });

    const double target = config_.targetTotalDuration;
    const double ceiling = target * config_.overshootCeiling;

    std::vector<Clip> accepted;
    double total = 0.0;
    for (const auto& clip : ranked) {
        if (static_cast<int>(accepted.size()) >= config_.maxClips || total >= target) {
            break;
        }
        if (total + clip.duration > ceiling) {
            REELCUT_LOG_DEBUG("Skip " << clip.id << ": would overshoot " << ceiling << "s");
            continue;
        }
        const bool blocked = std::any_of(accepted.begin(), accepted.end(), [&](const Clip& kept) {
            return conflicts(kept, clip, config_.minTimeGap);
        });
        if (blocked) {
            REELCUT_LOG_DEBUG("Skip " << clip.id << ": inside the corridor of an accepted clip");
            continue;
        }
        accepted.push_back(clip);
        total += clip.duration;
    }

    sort_chronologically(accepted);
    return accepted;
}

std::vector<Clip> CandidateSelector::smartMerge(const std::vector<Clip>& accepted, double maxDuration) const {
    std::vector<Clip> sorted = accepted;
    sort_chronologically(sorted);
    if (sorted.size() < 2) return sorted;

    std::vector<Clip> out;
    Clip current = sorted.front();
    for (std::size_t i = 1; i < sorted.size(); ++i) {
        const Clip& next = sorted[i];
        const double gap = next.t0 - current.t1;
        // The merged clip spans the gap too, so it counts toward the duration limit.
        const double combined = current.duration + gap + next.duration;
        if (gap <= config_.smartMergeGap && combined <= maxDuration && next.finalScore >= config_.smartMergeMinScore) {
            REELCUT_LOG_DEBUG("Merging " << current.id << " with " << next.id << " (gap " << gap << "s)");
            current = merge_clips(current, next);
        } else {
            out.push_back(std::move(current));
            current = next;
        }
    }
    out.push_back(std::move(current));
    return out;
}

SelectionOutcome CandidateSelector::select(const std::vector<Segment>& scored) const {
    SelectionOutcome outcome;

    std::vector<Clip> clips;
    clips.reserve(scored.size());
    for (const auto& seg : scored) clips.push_back(clip_from_segment(seg));
    outcome.pool = mergeShortBursts(std::move(clips));

    const double target = config_.targetTotalDuration;
    double threshold = config_.minScoreThreshold;

    bool fallback = false;
    auto candidates = filterByDuration(filterByScore(outcome.pool, threshold, fallback));
    const bool thin = static_cast<int>(candidates.size()) < config_.relaxMinPoolSize
                   || total_duration(candidates) < config_.relaxMinCoverage * target;
    if (thin && threshold > 0.0) {
        const double relaxedThreshold = std::max(0.0, threshold - config_.relaxStep);
        std::ostringstream note;
        note << "candidate pool thin (" << candidates.size() << " clips, " << format_duration(total_duration(candidates))
             << "); threshold relaxed " << threshold << " -> " << relaxedThreshold;
        outcome.notes.push_back(note.str());
        REELCUT_LOG_INFO(note.str());

        threshold = relaxedThreshold;
        outcome.relaxed = true;
        candidates = filterByDuration(filterByScore(outcome.pool, threshold, fallback));
    }
    outcome.threshold = threshold;
    outcome.percentileFallback = fallback;
    if (fallback) {
        outcome.notes.push_back("no segment reached the score threshold; percentile cut applied");
    }

    auto accepted = suppressOverlaps(candidates);
    auto merged = smartMerge(accepted, config_.maxClipDuration);

    if (total_duration(merged) < config_.forceMergeCoverage * target && merged.size() > 1) {
        const auto forced = smartMerge(merged, config_.maxClipDuration * config_.forceMergeCeiling);
        if (forced.size() < merged.size()) {
            outcome.forceMerged = true;
            outcome.notes.push_back("coverage below " + std::to_string(static_cast<int>(config_.forceMergeCoverage * 100))
                                    + "% of target; force merge pass applied");
        }
        merged = forced;
    }

    outcome.clips = std::move(merged);
    REELCUT_LOG_INFO("Selected " << outcome.clips.size() << " clips (" << format_duration(total_duration(outcome.clips))
                     << ") from " << outcome.pool.size() << " merged segments at threshold " << outcome.threshold);
    return outcome;
}

}  // namespace selection
}  // namespace reelcut
