#pragma once

#include "../ClipTypes.h"
#include "../Config.h"

#include <string>
#include <vector>

namespace reelcut {
namespace selection {

struct ReconcileOutcome {
    std::vector<Clip> clips;    // chronological
    double totalBefore{0.0};
    double totalAfter{0.0};
    int trimmed{0};
    int dropped{0};
    int added{0};
    std::vector<std::string> notes;
};

/**
 * DurationReconciler: bring the total clip duration back to the budget
 *
 * Over budget: trim the longest clips from their end, each by at most
 * trimPercentage of its length and never below minDurationGuard; drop the
 * weakest clips if the caps are not enough. Still under budget afterwards
 * (or from the start): add the best non-conflicting clips of the broader pool.
 *
 * Trimming moves only t1. Time-indexed data attached to a clip (subtitle cues
 * and the like) is cut by the renderer against the new bounds.
 */
class DurationReconciler {
  public:
    explicit DurationReconciler(SelectionConfig config);

    ReconcileOutcome reconcile(const std::vector<Clip>& clips, const std::vector<Clip>& pool) const;

    bool needsTrim(double total) const;
    std::vector<Clip> trim(const std::vector<Clip>& clips, int& trimmed, int& dropped) const;
    // Adds pool clips by score until target, never past `ceiling` seconds in total.
    std::vector<Clip> topUp(const std::vector<Clip>& clips,
                            const std::vector<Clip>& pool,
                            int& added,
                            double ceiling) const;

  private:
    SelectionConfig config_;
};

}  // namespace selection
}  // namespace reelcut
