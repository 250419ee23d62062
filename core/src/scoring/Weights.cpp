#include "reelcut/scoring/Weights.h"

namespace reelcut {
namespace scoring {

WeightProfile default_weights(ProcessingMode mode) {
    WeightProfile w;
    switch (mode) {
        case ProcessingMode::LiveStream:
            w.name = "stream";
            w.chatBurst = 0.65;
            w.acoustic = 0.15;
            w.semantic = 0.15;
            w.promptBoost = 0.05;
            break;
        case ProcessingMode::PoliticalSession:
            w.name = "political";
            w.chatBurst = 0.05;
            w.acoustic = 0.35;
            w.semantic = 0.55;
            w.promptBoost = 0.05;
            break;
    }
    return w;
}

double total_mass(const WeightProfile& weights) {
    return weights.chatBurst + weights.acoustic + weights.semantic + weights.promptBoost;
}

WeightProfile renormalize_for_missing_chat(const WeightProfile& weights) {
    WeightProfile out = weights;
    const double freed = weights.chatBurst;
    const double base = weights.acoustic + weights.semantic;

    if (base <= 0.0) {
        out.acoustic = weights.acoustic + 0.5 * freed;
        out.semantic = weights.semantic + 0.5 * freed;
    } else {
        out.acoustic = weights.acoustic + freed * (weights.acoustic / base);
        out.semantic = weights.semantic + freed * (weights.semantic / base);
    }
    out.chatBurst = 0.0;
    out.name = weights.name + "+no_chat";
    return out;
}

}  // namespace scoring
}  // namespace reelcut
