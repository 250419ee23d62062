#include "reelcut/selection/ShortsSelector.h"
#include "reelcut/CoreContract.h"
#include "reelcut/Logging.h"
#include "reelcut/Normalization.h"
#include "reelcut/Utility.h"

#include <algorithm>
#include <cstdio>
#include <sstream>

namespace reelcut {
namespace selection {

ShortsSelector::ShortsSelector(ShortsConfig config, double fallbackPercentile)
    : config_(std::move(config)), fallbackPercentile_(fallbackPercentile) {}

std::string ShortsSelector::shortTitle(const Clip& clip) {
    std::istringstream words(clip.transcript);
    std::string word;
    std::string base;
    for (int n = 0; n < 10 && (words >> word); ++n) {
        if (!base.empty()) base += ' ';
        base += word;
    }
    if (utf8_length(base) > 50) {
        base = utf8_prefix(base, 47) + contract::TITLE_ELLIPSIS;
    }
    if (base.empty()) {
        base = "Notable moment";
    }

    std::string title = base;
    if (clip.finalScore >= 0.9) {
        title = "[TOP] " + base;
    } else if (clip.finalScore >= 0.8) {
        title = "[HOT] " + base;
    } else if (clip.finalScore >= 0.7) {
        title = "[NEW] " + base;
    }

    const auto limit = static_cast<std::size_t>(contract::TITLE_MAX_CODEPOINTS);
    if (utf8_length(title) > limit) {
        title = utf8_prefix(title, limit - 3) + contract::TITLE_ELLIPSIS;
    }
    return title;
}

std::vector<Clip> ShortsSelector::select(const std::vector<Clip>& pool, double minScore) const {
    if (!config_.enabled || config_.count <= 0) return {};

    auto fits = [&](const Clip& c) { return c.duration >= config_.minDuration && c.duration <= config_.maxDuration; };

    std::vector<Clip> candidates;
    for (const auto& clip : pool) {
        if (fits(clip) && clip.finalScore >= minScore) candidates.push_back(clip);
    }

    if (candidates.empty() && minScore > 0.0 && !pool.empty()) {
        std::vector<double> scores;
        for (const auto& clip : pool) scores.push_back(clip.finalScore);
        const double cut = percentile(scores, fallbackPercentile_);
        REELCUT_LOG_WARN("No shorts candidate reached " << minScore << "; falling back to p" << fallbackPercentile_
                         << " cut " << cut);
        for (const auto& clip : pool) {
            if (fits(clip) && clip.finalScore >= cut) candidates.push_back(clip);
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(), [](const Clip& a, const Clip& b) { return a.t0 < b.t0; });
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Clip& a, const Clip& b) { return a.finalScore > b.finalScore; });
    if (candidates.size() > static_cast<std::size_t>(config_.count)) {
        candidates.resize(static_cast<std::size_t>(config_.count));
    }
    std::stable_sort(candidates.begin(), candidates.end(), [](const Clip& a, const Clip& b) { return a.t0 < b.t0; });

    for (std::size_t i = 0; i < candidates.size(); ++i) {
        char id[16];
        std::snprintf(id, sizeof(id), "short_%02zu", i + 1);
        candidates[i].clipId = id;
        candidates[i].title = shortTitle(candidates[i]);
    }
    return candidates;
}

}  // namespace selection
}  // namespace reelcut
