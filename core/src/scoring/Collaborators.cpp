#include "reelcut/scoring/Collaborators.h"
#include "reelcut/Normalization.h"

#include <algorithm>
#include <cctype>
#include <set>

namespace reelcut {
namespace scoring {

TableSemanticAssessor::TableSemanticAssessor(std::unordered_map<std::string, double> scores)
    : scores_(std::move(scores)) {}

std::vector<AssessmentResult> TableSemanticAssessor::assessBatch(const std::vector<AssessmentRequest>& batch) {
    std::vector<AssessmentResult> out;
    out.reserve(batch.size());
    for (const auto& request : batch) {
        const auto it = scores_.find(request.id);
        if (it != scores_.end()) {
            out.push_back({request.id, clamp01(it->second)});
        }
    }
    return out;
}

std::vector<std::string> tokenize_words(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    for (char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        // Bytes >= 0x80 belong to multi-byte UTF-8 letters; keep them inside words.
        if (std::isalnum(c) || c >= 0x80) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) words.push_back(std::move(current));
    return words;
}

double LexicalPromptSimilarity::similarity(const std::string& prompt, const std::string& transcript) const {
    const auto promptWords = tokenize_words(prompt);
    if (promptWords.empty()) return 0.0;

    const std::set<std::string> wanted(promptWords.begin(), promptWords.end());
    const auto spokenWords = tokenize_words(transcript);
    const std::set<std::string> spoken(spokenWords.begin(), spokenWords.end());

    const auto hits = std::count_if(wanted.begin(), wanted.end(),
                                    [&](const std::string& w) { return spoken.count(w) > 0; });
    return static_cast<double>(hits) / static_cast<double>(wanted.size());
}

}  // namespace scoring
}  // namespace reelcut
