#pragma once

#include "../ClipTypes.h"
#include "../Config.h"
#include "TitleGenerator.h"

#include <chrono>
#include <string>
#include <vector>

namespace reelcut {
namespace planning {

/**
 * PartPlanner: split a long source into releasable parts
 *
 * calculateSplitStrategy() runs once per run, before selection, and fixes the
 * part count, the per-part target and the score threshold. planParts() later
 * distributes the final clips over the parts and schedules them.
 */
class PartPlanner {
  public:
    explicit PartPlanner(SplitterConfig config);

    SplitPlan calculateSplitStrategy(double sourceDuration) const;

    static int partsForDuration(double sourceDuration);
    static int targetPerPart(double sourceDuration, int numParts);
    static double thresholdFor(double sourceDuration);

    /**
     * Streaming bin-packer. Clips are taken chronologically; each goes to the
     * part with the lowest cost
     *   0.6 * fill / target + 0.4 * |part mean after adding - global mean|
     * where parts at 115% of target are closed. Empty parts are removed.
     */
    std::vector<std::vector<Clip>> packClips(const std::vector<Clip>& clips, int numParts, int targetPerPart) const;

    // Fills plan.parts from the final clip set.
    void planParts(SplitPlan& plan,
                   const std::vector<Clip>& clips,
                   std::chrono::year_month_day baseDate,
                   const TitleGenerator& titles) const;

  private:
    SplitterConfig config_;
};

std::string format_split_summary(const SplitPlan& plan);

}  // namespace planning
}  // namespace reelcut
