#pragma once

#include "reelcut/ClipTypes.h"
#include "reelcut/Config.h"
#include "reelcut/RunControl.h"
#include "reelcut/SQLiteStore.h"
#include "reelcut/scoring/Collaborators.h"
#include "reelcut/scoring/ScoringStrategy.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace reelcut {

struct HighlightRequest {
    std::string runId;
    std::vector<Segment> segments;
    double sourceDuration{0.0};     // <= 0: taken from the last segment end
    ChatHistogram chat;
    std::string prompt;
    std::optional<std::chrono::year_month_day> baseDate;  // default: today
};

/**
 * HighlightEngine: complete highlight selection pipeline
 *
 * Orchestrates: Split plan → Scoring → Selection → Coverage → Duration → Parts → Storage
 *
 * Holds the single-flight run handle; a second concurrent run() returns
 * RunStatus::Busy. Cancellation is observed between stages.
 */
class HighlightEngine {
  public:
    /**
     * @param config validated eagerly; throws ConfigError
     * @param assessor optional semantic scorer (not owned)
     * @param promptSimilarity optional prompt matcher (not owned)
     * @param databasePath empty to skip persistence
     */
    explicit HighlightEngine(PipelineConfig config,
                             scoring::SemanticAssessor* assessor = nullptr,
                             const scoring::PromptSimilarity* promptSimilarity = nullptr,
                             const std::string& databasePath = {});

    RunResult run(const HighlightRequest& request, const CancellationToken* cancel = nullptr);

    RunHandle& runHandle() { return handle_; }
    const PipelineConfig& config() const { return config_; }

  private:
    RunResult execute(const HighlightRequest& request, const CancellationToken* cancel);

    PipelineConfig config_;
    std::unique_ptr<scoring::ScoringStrategy> strategy_;
    scoring::SemanticAssessor* assessor_{nullptr};
    const scoring::PromptSimilarity* promptSimilarity_{nullptr};
    RunHandle handle_;

    // Storage
    std::unique_ptr<SQLiteStore> store_;
};

}  // namespace reelcut
