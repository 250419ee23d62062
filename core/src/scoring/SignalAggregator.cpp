#include "reelcut/scoring/SignalAggregator.h"
#include "reelcut/scoring/ChatBurst.h"
#include "reelcut/CoreContract.h"
#include "reelcut/Logging.h"
#include "reelcut/Normalization.h"
#include "reelcut/Utility.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <unordered_map>
#include <unordered_set>

namespace reelcut {
namespace scoring {

namespace {

const ChatHistogram& empty_histogram() {
    static const ChatHistogram empty;
    return empty;
}

// Drops malformed segments, repairs duration, fills missing ids.
std::vector<Segment> validate_input(const std::vector<Segment>& input, int& rejected) {
    std::vector<Segment> accepted;
    accepted.reserve(input.size());
    std::unordered_set<std::string> seen;

    for (std::size_t i = 0; i < input.size(); ++i) {
        Segment seg = input[i];
        if (seg.id.empty()) {
            seg.id = "seg_" + std::to_string(i);
        }
        if (!std::isfinite(seg.t0) || !std::isfinite(seg.t1) || seg.t1 <= seg.t0) {
            REELCUT_LOG_WARN("Rejecting segment " << seg.id << ": invalid time range [" << seg.t0 << ", " << seg.t1 << "]");
            ++rejected;
            continue;
        }
        if (!seen.insert(seg.id).second) {
            REELCUT_LOG_WARN("Rejecting segment " << seg.id << ": duplicate id");
            ++rejected;
            continue;
        }
        seg.duration = seg.t1 - seg.t0;
        accepted.push_back(std::move(seg));
    }

    std::stable_sort(accepted.begin(), accepted.end(),
                     [](const Segment& a, const Segment& b) { return a.t0 < b.t0; });
    return accepted;
}

}  // namespace

SignalAggregator::SignalAggregator(ScoringConfig config,
                                   SemanticAssessor* assessor,
                                   const PromptSimilarity* promptSimilarity)
    : config_(std::move(config)), assessor_(assessor), promptSimilarity_(promptSimilarity) {}

double SignalAggregator::acoustic_score(const Segment& segment) {
    const auto& f = segment.features;
    if (f.count("acoustic_score") > 0) {
        return clamp01(feature_value(f, "acoustic_score"));
    }
    const double raw = contract::ACOUSTIC_W_RMS * feature_value(f, "rms_z")
                     + contract::ACOUSTIC_W_CENTROID * feature_value(f, "spectral_centroid_z")
                     + contract::ACOUSTIC_W_SPEECH_RATE * feature_value(f, "speech_rate_wpm") / contract::SPEECH_RATE_NORM_WPM
                     + contract::ACOUSTIC_W_FLUX * feature_value(f, "spectral_flux")
                     + contract::ACOUSTIC_W_PAUSES * feature_value(f, "dramatic_pauses");
    return clamp01(raw);
}

double SignalAggregator::keyword_score(const Segment& segment) {
    return clamp01(feature_value(segment.features, "keyword_score") / contract::KEYWORD_SCORE_NORM);
}

double SignalAggregator::composite(const Subscores& s, const WeightProfile& w) {
    const double value = clamp01(s.chatBurst) * w.chatBurst
                       + clamp01(s.acoustic) * w.acoustic
                       + clamp01(s.semantic) * w.semantic
                       + clamp01(s.promptSimilarity) * w.promptBoost;
    return clamp01(value);
}

double SignalAggregator::position_factor(const Segment& segment, double sourceDuration) const {
    double position = 0.5;
    if (segment.features.count("position_in_video") > 0) {
        position = feature_value(segment.features, "position_in_video", 0.5);
    } else if (sourceDuration > 0.0) {
        position = 0.5 * (segment.t0 + segment.t1) / sourceDuration;
    }
    position = std::clamp(position, 0.0, 1.0);
    return 1.0 + config_.diversityBonus * (1.0 - std::abs(position - 0.5));
}

std::vector<std::size_t> SignalAggregator::select_candidates(const std::vector<Segment>& segments) const {
    std::vector<std::size_t> order(segments.size());
    for (std::size_t i = 0; i < order.size(); ++i) order[i] = i;

    // Input is chronological, so the stable sort breaks pre-score ties by time.
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return segments[a].preScore > segments[b].preScore;
    });

    std::vector<bool> picked(segments.size(), false);
    const std::size_t topN = std::min(order.size(), static_cast<std::size_t>(config_.prefilterTopN));
    for (std::size_t r = 0; r < topN; ++r) picked[order[r]] = true;

    int forced = 0;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (!picked[i] && feature_value(segments[i].features, "keyword_score") >= config_.keywordForceThreshold) {
            picked[i] = true;
            ++forced;
        }
    }
    if (forced > 0) {
        REELCUT_LOG_DEBUG("Prefilter force-included " << forced << " keyword-heavy segments");
    }

    std::vector<std::size_t> out;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (picked[i]) out.push_back(i);
    }
    return out;
}

void SignalAggregator::assign_semantic(std::vector<Segment>& segments,
                                       const std::vector<std::size_t>& candidates,
                                       AggregationReport& report) const {
    if (!assessor_) {
        for (std::size_t idx : candidates) {
            const double kw = feature_value(segments[idx].features, "keyword_score");
            segments[idx].subscores.semantic = std::min(1.0, std::max(0.0, kw) / contract::KEYWORD_FALLBACK_SEMANTIC_NORM);
        }
        REELCUT_LOG_WARN("No semantic assessor configured; approximating semantic score from keyword density");
        return;
    }

    const std::size_t batchSize = static_cast<std::size_t>(std::max(1, config_.semanticBatchSize));
    for (std::size_t start = 0; start < candidates.size(); start += batchSize) {
        const std::size_t end = std::min(candidates.size(), start + batchSize);

        std::vector<AssessmentRequest> batch;
        batch.reserve(end - start);
        for (std::size_t k = start; k < end; ++k) {
            const auto& seg = segments[candidates[k]];
            batch.push_back({seg.id, utf8_prefix(seg.transcript, config_.transcriptCharLimit)});
        }

        std::unordered_map<std::string, double> byId;
        try {
            for (const auto& result : assessor_->assessBatch(batch)) {
                byId[result.id] = clamp01(result.score);
            }
        } catch (const std::exception& e) {
            ++report.failedBatches;
            REELCUT_LOG_WARN("Semantic batch " << (start / batchSize + 1) << " failed (" << e.what()
                             << "); assigning neutral score " << config_.neutralSemanticScore);
        }

        for (std::size_t k = start; k < end; ++k) {
            auto& seg = segments[candidates[k]];
            const auto it = byId.find(seg.id);
            if (it != byId.end()) {
                seg.subscores.semantic = it->second;
            } else {
                seg.subscores.semantic = config_.neutralSemanticScore;
            }
        }
    }
}

AggregationReport SignalAggregator::score(const std::vector<Segment>& segments,
                                          const ScoringStrategy& strategy,
                                          const ScoringContext& context) const {
    AggregationReport report;
    report.segments = validate_input(segments, report.rejected);

    const ChatHistogram& histogram = context.chat ? *context.chat : empty_histogram();
    const ChatBurstScorer chat(histogram, config_.chatBaselineWindow, config_.chatPeakExtension);
    report.chatAvailable = chat.available();
    report.weights = strategy.effectiveWeights(report.chatAvailable);

    if (strategy.expectsChatSignal() && !report.chatAvailable) {
        REELCUT_LOG_WARN("No chat data; chat weight redistributed to acoustic=" << report.weights.acoustic
                         << " semantic=" << report.weights.semantic);
    }

    auto& scored = report.segments;
    for (auto& seg : scored) {
        seg.subscores = Subscores{};
        seg.subscores.acoustic = acoustic_score(seg);
        seg.subscores.keyword = keyword_score(seg);
        seg.preScore = contract::PRESCORE_W_ACOUSTIC * seg.subscores.acoustic
                     + contract::PRESCORE_W_KEYWORD * seg.subscores.keyword;
        seg.subscores.chatBurst = chat.score(seg.t0, seg.t1);
    }

    const auto candidates = select_candidates(scored);
    report.candidates = static_cast<int>(candidates.size());
    assign_semantic(scored, candidates, report);

    const bool usePrompt = promptSimilarity_ != nullptr && !context.prompt.empty();
    for (auto& seg : scored) {
        seg.subscores.promptSimilarity = usePrompt ? clamp01(promptSimilarity_->similarity(context.prompt, seg.transcript)) : 0.0;
        const double base = composite(seg.subscores, report.weights);
        seg.finalScore = clamp01(base * position_factor(seg, context.sourceDuration));
    }

    REELCUT_LOG_INFO("Scored " << scored.size() << " segments (" << report.rejected << " rejected, "
                     << report.candidates << " semantic candidates, " << report.failedBatches << " failed batches)");
    return report;
}

}  // namespace scoring
}  // namespace reelcut
