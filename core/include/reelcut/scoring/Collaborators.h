#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace reelcut {
namespace scoring {

struct AssessmentRequest {
    std::string id;
    std::string transcript;
};

struct AssessmentResult {
    std::string id;
    double score{0.0};  // [0,1]
};

/**
 * SemanticAssessor: external "semantic interest" scorer
 *
 * Receives one batch at a time. A failed batch is reported by throwing; the
 * aggregator degrades it to the neutral score. Results may come back in any
 * order and may omit ids.
 */
class SemanticAssessor {
  public:
    virtual ~SemanticAssessor() = default;
    virtual std::vector<AssessmentResult> assessBatch(const std::vector<AssessmentRequest>& batch) = 0;
};

class PromptSimilarity {
  public:
    virtual ~PromptSimilarity() = default;
    virtual double similarity(const std::string& prompt, const std::string& transcript) const = 0;
};

// Serves precomputed scores keyed by segment id.
class TableSemanticAssessor : public SemanticAssessor {
  public:
    explicit TableSemanticAssessor(std::unordered_map<std::string, double> scores);

    std::vector<AssessmentResult> assessBatch(const std::vector<AssessmentRequest>& batch) override;

  private:
    std::unordered_map<std::string, double> scores_;
};

// Fraction of distinct prompt words that also occur in the transcript.
class LexicalPromptSimilarity : public PromptSimilarity {
  public:
    double similarity(const std::string& prompt, const std::string& transcript) const override;
};

std::vector<std::string> tokenize_words(const std::string& text);

}  // namespace scoring
}  // namespace reelcut
