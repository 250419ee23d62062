#pragma once

#include "../ClipTypes.h"
#include "../Config.h"

#include <string>
#include <vector>

namespace reelcut {
namespace selection {

/**
 * ShortsSelector: best vertical-format candidates (15-60s by default)
 *
 * Works on the merged segment pool independently of the main reel, so a
 * moment may appear in both. Output is chronological, ids short_01...
 */
class ShortsSelector {
  public:
    ShortsSelector(ShortsConfig config, double fallbackPercentile);

    std::vector<Clip> select(const std::vector<Clip>& pool, double minScore) const;

    // "[TOP] first ten words of the transcript"
    static std::string shortTitle(const Clip& clip);

  private:
    ShortsConfig config_;
    double fallbackPercentile_{80.0};
};

}  // namespace selection
}  // namespace reelcut
