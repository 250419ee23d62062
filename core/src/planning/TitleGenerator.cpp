#include "reelcut/planning/TitleGenerator.h"
#include "reelcut/CoreContract.h"
#include "reelcut/Utility.h"

#include <algorithm>

namespace reelcut {
namespace planning {

namespace {

std::vector<Clip> best_clips(const std::vector<Clip>& clips, std::size_t count) {
    std::vector<Clip> ranked = clips;
    std::stable_sort(ranked.begin(), ranked.end(), [](const Clip& a, const Clip& b) { return a.finalScore > b.finalScore; });
    if (ranked.size() > count) ranked.resize(count);
    return ranked;
}

std::vector<Keyword> top_keywords(const Clip& clip, std::size_t count) {
    std::vector<Keyword> keywords = clip.keywords;
    std::stable_sort(keywords.begin(), keywords.end(), [](const Keyword& a, const Keyword& b) { return a.weight > b.weight; });
    if (keywords.size() > count) keywords.resize(count);
    return keywords;
}

void push_distinct(std::vector<std::string>& out, const std::string& token) {
    const std::string key = ascii_lower(token);
    const bool present = std::any_of(out.begin(), out.end(), [&](const std::string& s) { return ascii_lower(s) == key; });
    if (!present) out.push_back(token);
}

}  // namespace

TitleGenerator::TitleGenerator(TitleConfig config, std::string context)
    : config_(std::move(config)), context_(std::move(context)) {
    for (const auto& name : config_.entityNames) {
        if (!name.empty()) entitiesLower_.push_back(ascii_lower(name));
    }
}

bool TitleGenerator::isEntity(const std::string& token) const {
    const std::string lower = ascii_lower(token);
    return std::any_of(entitiesLower_.begin(), entitiesLower_.end(),
                       [&](const std::string& e) { return lower.find(e) != std::string::npos; });
}

std::string TitleGenerator::headline(const std::vector<Clip>& partClips) const {
    std::vector<std::string> entities;
    std::vector<std::string> plain;
    for (const auto& clip : best_clips(partClips, contract::TITLE_TOP_CLIPS)) {
        for (const auto& kw : top_keywords(clip, contract::TITLE_KEYWORDS_PER_CLIP)) {
            if (kw.token.empty()) continue;
            if (isEntity(kw.token)) {
                push_distinct(entities, capitalize_first(kw.token));
            } else {
                push_distinct(plain, capitalize_first(kw.token));
            }
        }
    }

    if (entities.size() >= 2) {
        return entities[0] + " vs " + entities[1] + " - " + context_;
    }
    if (entities.size() == 1) {
        return entities[0] + " in focus - " + context_;
    }
    if (plain.size() >= 2) {
        return context_ + ": " + plain[0] + " vs " + plain[1];
    }
    if (plain.size() == 1) {
        return context_ + ": " + plain[0];
    }
    return context_ + " - Best Moments";
}

std::string TitleGenerator::partTitle(const std::vector<Clip>& partClips,
                                      int partNumber,
                                      int totalParts,
                                      const std::string& dateLabel) const {
    std::string suffix;
    if (totalParts > 1) {
        suffix += " | Part " + std::to_string(partNumber) + "/" + std::to_string(totalParts);
    }
    if (!dateLabel.empty()) {
        suffix += " | " + dateLabel;
    }
    // The part index and date always survive; only the headline is shortened.
    const auto limit = static_cast<std::size_t>(contract::TITLE_MAX_CODEPOINTS);
    const std::size_t room = limit > utf8_length(suffix) ? limit - utf8_length(suffix) : 0;
    return truncate(headline(partClips), room) + suffix;
}

std::vector<std::string> TitleGenerator::partKeywords(const std::vector<Clip>& partClips) const {
    std::vector<std::string> out;
    for (const auto& clip : best_clips(partClips, contract::TITLE_TOP_CLIPS)) {
        for (const auto& kw : clip.keywords) {
            if (kw.token.empty()) continue;
            if (std::find(out.begin(), out.end(), kw.token) == out.end()) out.push_back(kw.token);
        }
    }
    if (out.size() > static_cast<std::size_t>(contract::PART_METADATA_KEYWORDS)) {
        out.resize(static_cast<std::size_t>(contract::PART_METADATA_KEYWORDS));
    }
    return out;
}

std::string TitleGenerator::clipTitle(const Clip& clip) {
    std::string title;
    for (const auto& kw : top_keywords(clip, contract::TITLE_KEYWORDS_PER_CLIP)) {
        if (kw.token.empty()) continue;
        if (!title.empty()) title += " \xE2\x80\xA2 ";
        title += capitalize_first(kw.token);
    }
    return title.empty() ? "Notable moment" : truncate(title);
}

std::string TitleGenerator::truncate(const std::string& title, std::size_t limit) {
    if (utf8_length(title) <= limit) return title;
    const std::string ellipsis = contract::TITLE_ELLIPSIS;
    if (limit <= ellipsis.size()) return utf8_prefix(title, limit);
    return utf8_prefix(title, limit - ellipsis.size()) + ellipsis;
}

}  // namespace planning
}  // namespace reelcut
