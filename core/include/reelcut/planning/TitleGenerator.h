#pragma once

#include "../ClipTypes.h"
#include "../Config.h"
#include "../CoreContract.h"

#include <cstddef>
#include <string>
#include <vector>

namespace reelcut {
namespace planning {

/**
 * TitleGenerator: rule-based headlines for parts and clips
 *
 * Looks at the top-weighted keywords of a part's best clips. Keywords that
 * contain a configured entity name count as entities:
 *   >= 2 entities  -> "A vs B - <context>"
 *   1 entity       -> "A in focus - <context>"
 *   keywords only  -> "<context>: K1 vs K2" or "<context>: K1"
 *   nothing        -> "<context> - Best Moments"
 * followed by " | Part i/N" (multi-part only) and " | DD.MM.YYYY".
 * Never longer than 100 code points.
 */
class TitleGenerator {
  public:
    TitleGenerator(TitleConfig config, std::string context);

    std::string partTitle(const std::vector<Clip>& partClips,
                          int partNumber,
                          int totalParts,
                          const std::string& dateLabel) const;

    // First distinct keyword tokens of the part's best clips.
    std::vector<std::string> partKeywords(const std::vector<Clip>& partClips) const;

    // Per-clip label: top three keywords joined by " • ".
    static std::string clipTitle(const Clip& clip);

    // Cuts to `limit` code points, the last three being "...".
    static std::string truncate(const std::string& title,
                                std::size_t limit = static_cast<std::size_t>(contract::TITLE_MAX_CODEPOINTS));

  private:
    bool isEntity(const std::string& token) const;
    std::string headline(const std::vector<Clip>& partClips) const;

    TitleConfig config_;
    std::string context_;
    std::vector<std::string> entitiesLower_;
};

}  // namespace planning
}  // namespace reelcut
