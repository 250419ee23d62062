#pragma once

#include "../ClipTypes.h"

namespace reelcut {
namespace scoring {

// Default composite weights per processing mode.
WeightProfile default_weights(ProcessingMode mode);

double total_mass(const WeightProfile& weights);

/**
 * Zero the chat weight and hand its mass to acoustic and semantic in
 * proportion to their current values (evenly when both are zero).
 * acoustic' + semantic' == acoustic + semantic + chatBurst.
 */
WeightProfile renormalize_for_missing_chat(const WeightProfile& weights);

}  // namespace scoring
}  // namespace reelcut
