#include "reelcut/planning/PartPlanner.h"
#include "reelcut/planning/Schedule.h"
#include "reelcut/CoreContract.h"
#include "reelcut/Logging.h"
#include "reelcut/Normalization.h"
#include "reelcut/Utility.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace reelcut {
namespace planning {

namespace {

std::string hours_label(double seconds) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << seconds / 3600.0 << "h";
    return out.str();
}

std::string explain_part_count(double sourceDuration, int numParts) {
    const std::string h = hours_label(sourceDuration);
    switch (numParts) {
        case 1:
            return "source " + h + " < 1h -> single part";
        case 2:
            return "source " + h + " in 1-2h -> 2 parts";
        case 3:
            return "source " + h + " in 2-4h -> 3 parts";
        case 4:
            return "source " + h + " in 4-6h -> 4 parts";
        default:
            return "source " + h + " >= 6h -> " + std::to_string(numParts) + " parts (one per 4h, max "
                   + std::to_string(contract::SPLIT_MAX_PARTS) + ")";
    }
}

}  // namespace

PartPlanner::PartPlanner(SplitterConfig config) : config_(std::move(config)) {}

int PartPlanner::partsForDuration(double sourceDuration) {
    if (sourceDuration < contract::SPLIT_ONE_PART_BELOW_SEC) return 1;
    if (sourceDuration < contract::SPLIT_TWO_PARTS_BELOW_SEC) return 2;
    if (sourceDuration < contract::SPLIT_THREE_PARTS_BELOW_SEC) return 3;
    if (sourceDuration < contract::SPLIT_FOUR_PARTS_BELOW_SEC) return 4;
    const double parts = std::ceil(sourceDuration / contract::SPLIT_SECONDS_PER_PART_BEYOND);
    return static_cast<int>(std::min(static_cast<double>(contract::SPLIT_MAX_PARTS), parts));
}

int PartPlanner::targetPerPart(double sourceDuration, int numParts) {
    const double share = contract::SPLIT_PART_SHARE_OF_SOURCE * sourceDuration / std::max(1, numParts);
    if (share < contract::PART_MIN_DURATION_SEC) return contract::PART_MIN_DURATION_SEC;
    if (share > contract::PART_MAX_DURATION_SEC) return contract::PART_MAX_DURATION_SEC;
    return static_cast<int>(share);
}

double PartPlanner::thresholdFor(double sourceDuration) {
    if (sourceDuration > contract::VERY_LONG_SOURCE_SEC) return contract::SCORE_THRESHOLD_VERY_LONG;
    if (sourceDuration > contract::LONG_SOURCE_SEC) return contract::SCORE_THRESHOLD_LONG;
    return contract::SCORE_THRESHOLD_DEFAULT;
}

SplitPlan PartPlanner::calculateSplitStrategy(double sourceDuration) const {
    SplitPlan plan;
    plan.sourceDuration = sourceDuration;

    if (config_.overrideParts) {
        plan.numParts = *config_.overrideParts;
        plan.reason = "manual override: " + std::to_string(plan.numParts) + " parts";
    } else {
        plan.numParts = partsForDuration(sourceDuration);
        plan.reason = explain_part_count(sourceDuration, plan.numParts);
    }

    if (config_.overrideTargetMinutes) {
        plan.targetDurationPerPart = *config_.overrideTargetMinutes * 60;
        plan.reason += " | target " + std::to_string(*config_.overrideTargetMinutes) + "min per part (manual override)";
    } else {
        plan.targetDurationPerPart = targetPerPart(sourceDuration, plan.numParts);
        plan.reason += " | target " + format_duration(plan.targetDurationPerPart) + " per part (10% of source, clamped to "
                       + std::to_string(contract::PART_MIN_DURATION_SEC) + "-"
                       + std::to_string(contract::PART_MAX_DURATION_SEC) + "s)";
    }
    plan.totalTargetDuration = plan.targetDurationPerPart * plan.numParts;

    plan.minScoreThreshold = thresholdFor(sourceDuration);
    std::ostringstream threshold;
    threshold << std::fixed << std::setprecision(2) << plan.minScoreThreshold;
    if (sourceDuration > contract::VERY_LONG_SOURCE_SEC) {
        plan.reason += " | score threshold " + threshold.str() + " (very long source > 6h)";
    } else if (sourceDuration > contract::LONG_SOURCE_SEC) {
        plan.reason += " | score threshold " + threshold.str() + " (long source > 4h)";
    } else {
        plan.reason += " | score threshold " + threshold.str();
    }

    plan.compressionRatio = sourceDuration > 0.0 ? plan.totalTargetDuration / sourceDuration : 0.0;

    REELCUT_LOG_INFO("Split plan: " << plan.reason);
    return plan;
}

std::vector<std::vector<Clip>> PartPlanner::packClips(const std::vector<Clip>& clips,
                                                      int numParts,
                                                      int targetPerPart) const {
    const std::size_t n = static_cast<std::size_t>(std::max(1, numParts));
    std::vector<Clip> ordered = clips;
    std::stable_sort(ordered.begin(), ordered.end(), [](const Clip& a, const Clip& b) { return a.t0 < b.t0; });
    if (n == 1) {
        return ordered.empty() ? std::vector<std::vector<Clip>>{} : std::vector<std::vector<Clip>>{ordered};
    }

    std::vector<double> scores;
    scores.reserve(ordered.size());
    for (const auto& clip : ordered) scores.push_back(clip.finalScore);
    const double globalMean = mean(scores);

    const double target = std::max(1, targetPerPart);
    const double closedAt = target * contract::PACK_OVERFILL_RATIO;
    const double inf = std::numeric_limits<double>::infinity();

    std::vector<std::vector<Clip>> parts(n);
    std::vector<double> filled(n, 0.0);
    std::vector<double> scoreSum(n, 0.0);

    for (const auto& clip : ordered) {
        std::size_t best = 0;
        double bestCost = inf;
        for (std::size_t p = 0; p < n; ++p) {
            if (filled[p] >= closedAt) continue;
            const double avgAfter = (scoreSum[p] + clip.finalScore) / static_cast<double>(parts[p].size() + 1);
            const double cost = contract::PACK_W_FILL * (filled[p] / target)
                              + contract::PACK_W_QUALITY * std::abs(avgAfter - globalMean);
            if (cost < bestCost) {
                bestCost = cost;
                best = p;
            }
        }
        if (bestCost == inf) {
            // Every part is closed; the least-filled one absorbs the overflow.
            best = static_cast<std::size_t>(std::min_element(filled.begin(), filled.end()) - filled.begin());
        }
        parts[best].push_back(clip);
        filled[best] += clip.duration;
        scoreSum[best] += clip.finalScore;
    }

    parts.erase(std::remove_if(parts.begin(), parts.end(), [](const std::vector<Clip>& p) { return p.empty(); }),
                parts.end());
    return parts;
}

void PartPlanner::planParts(SplitPlan& plan,
                            const std::vector<Clip>& clips,
                            std::chrono::year_month_day baseDate,
                            const TitleGenerator& titles) const {
    const auto packed = packClips(clips, plan.numParts, plan.targetDurationPerPart);
    const int total = static_cast<int>(packed.size());
    if (total < plan.numParts) {
        REELCUT_LOG_WARN("Only " << total << " of " << plan.numParts << " planned parts received clips");
    }

    plan.parts.clear();
    for (int i = 0; i < total; ++i) {
        const auto& partClips = packed[static_cast<std::size_t>(i)];
        PartPlan part;
        part.partNumber = i + 1;
        part.totalParts = total;
        part.clips = partClips;
        part.duration = total_duration(partClips);

        std::vector<double> scores;
        for (const auto& clip : partClips) scores.push_back(clip.finalScore);
        part.avgScore = mean(scores);

        const auto date = publish_date(baseDate, config_.firstPublishDayOffset, i);
        part.publishAt = format_publish_time(date, config_.publishHour, config_.publishMinute);
        part.title = titles.partTitle(partClips, part.partNumber, total, format_title_date(date));
        part.keywords = titles.partKeywords(partClips);
        part.filenameSuffix = total > 1 ? "_part" + std::to_string(part.partNumber) + "of" + std::to_string(total) : "";

        plan.parts.push_back(std::move(part));
    }
}

std::string format_split_summary(const SplitPlan& plan) {
    std::ostringstream out;
    out << "Split plan\n";
    out << "  source:      " << format_duration(plan.sourceDuration) << "\n";
    out << "  parts:       " << plan.numParts << " x " << format_duration(plan.targetDurationPerPart) << "\n";
    out << "  total:       " << format_duration(plan.totalTargetDuration) << " ("
        << std::fixed << std::setprecision(1) << plan.compressionRatio * 100.0 << "% of source)\n";
    out << "  threshold:   " << std::setprecision(2) << plan.minScoreThreshold << "\n";
    out << "  reason:      " << plan.reason << "\n";
    for (const auto& part : plan.parts) {
        out << "  part " << part.partNumber << "/" << part.totalParts << ": " << part.clips.size() << " clips, "
            << format_duration(part.duration) << ", avg score " << std::setprecision(2) << part.avgScore
            << ", publish " << part.publishAt << "\n";
        out << "    " << part.title << "\n";
    }
    return out.str();
}

}  // namespace planning
}  // namespace reelcut
