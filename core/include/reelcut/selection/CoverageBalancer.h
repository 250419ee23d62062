#pragma once

#include "../ClipTypes.h"
#include "../Config.h"

#include <vector>

namespace reelcut {
namespace selection {

struct BalanceOutcome {
    std::vector<Clip> clips;    // chronological
    int binCap{0};
    int floor{0};
    bool backfilled{false};
};

/**
 * CoverageBalancer: limit how many clips one region of the source contributes
 *
 * The source is cut into positionBins equal windows; a clip belongs to the
 * window holding its start. Each window keeps its best binCap clips. When
 * that leaves fewer than floor clips, the result is instead the best floor
 * clips of the whole input.
 */
class CoverageBalancer {
  public:
    explicit CoverageBalancer(SelectionConfig config);

    BalanceOutcome balance(const std::vector<Clip>& clips, double sourceDuration) const;

    int binCapFor(double sourceDuration) const;
    int floorFor(double sourceDuration) const;
    int binIndex(double t0, double sourceDuration) const;

  private:
    SelectionConfig config_;
};

}  // namespace selection
}  // namespace reelcut
