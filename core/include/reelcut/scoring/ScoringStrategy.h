#pragma once

#include "../ClipTypes.h"
#include "../Config.h"

#include <memory>
#include <optional>
#include <string>

namespace reelcut {
namespace scoring {

/**
 * ScoringStrategy: per-mode scoring policy
 *
 * Chooses the weight profile, whether the chat signal is expected, and the
 * headline context used by the title generator. Injected into SignalAggregator
 * and HighlightEngine instead of branching on the mode name.
 */
class ScoringStrategy {
  public:
    virtual ~ScoringStrategy() = default;

    virtual ProcessingMode mode() const = 0;
    virtual WeightProfile baseWeights() const = 0;
    virtual bool expectsChatSignal() const = 0;
    virtual std::string titleContext(const TitleConfig& titles) const = 0;

    // Base weights, renormalized when chat is expected but missing.
    WeightProfile effectiveWeights(bool chatAvailable) const;
};

class PoliticalSessionStrategy : public ScoringStrategy {
  public:
    explicit PoliticalSessionStrategy(std::optional<WeightProfile> weightOverride = std::nullopt);

    ProcessingMode mode() const override { return ProcessingMode::PoliticalSession; }
    WeightProfile baseWeights() const override { return weights_; }
    bool expectsChatSignal() const override { return false; }
    std::string titleContext(const TitleConfig& titles) const override { return titles.politicalContext; }

  private:
    WeightProfile weights_;
};

class LiveStreamStrategy : public ScoringStrategy {
  public:
    explicit LiveStreamStrategy(std::optional<WeightProfile> weightOverride = std::nullopt);

    ProcessingMode mode() const override { return ProcessingMode::LiveStream; }
    WeightProfile baseWeights() const override { return weights_; }
    bool expectsChatSignal() const override { return true; }
    std::string titleContext(const TitleConfig& titles) const override { return titles.streamContext; }

  private:
    WeightProfile weights_;
};

std::unique_ptr<ScoringStrategy> make_scoring_strategy(ProcessingMode mode,
                                                       const std::optional<WeightProfile>& weightOverride);

}  // namespace scoring
}  // namespace reelcut
