#include "reelcut/scoring/ScoringStrategy.h"
#include "reelcut/scoring/Weights.h"

namespace reelcut {
namespace scoring {

WeightProfile ScoringStrategy::effectiveWeights(bool chatAvailable) const {
    const WeightProfile base = baseWeights();
    if (expectsChatSignal() && !chatAvailable) {
        return renormalize_for_missing_chat(base);
    }
    return base;
}

PoliticalSessionStrategy::PoliticalSessionStrategy(std::optional<WeightProfile> weightOverride)
    : weights_(weightOverride ? *weightOverride : default_weights(ProcessingMode::PoliticalSession)) {}

LiveStreamStrategy::LiveStreamStrategy(std::optional<WeightProfile> weightOverride)
    : weights_(weightOverride ? *weightOverride : default_weights(ProcessingMode::LiveStream)) {}

std::unique_ptr<ScoringStrategy> make_scoring_strategy(ProcessingMode mode,
                                                       const std::optional<WeightProfile>& weightOverride) {
    switch (mode) {
        case ProcessingMode::LiveStream:
            return std::make_unique<LiveStreamStrategy>(weightOverride);
        case ProcessingMode::PoliticalSession:
            break;
    }
    return std::make_unique<PoliticalSessionStrategy>(weightOverride);
}

}  // namespace scoring
}  // namespace reelcut
