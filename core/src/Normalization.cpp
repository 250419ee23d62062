#include "reelcut/Normalization.h"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace reelcut {

double mean(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double quantile(std::vector<double> v, double q) {
    if (v.empty()) return 0.0;
    q = std::clamp(q, 0.0, 1.0);

    const double pos = q * static_cast<double>(v.size() - 1);
    const std::size_t k = static_cast<std::size_t>(std::floor(pos));
    const std::size_t k2 = std::min(k + 1, v.size() - 1);
    const double frac = pos - static_cast<double>(k);

    std::nth_element(v.begin(), v.begin() + k, v.end());
    const double a = v[k];
    if (k2 == k) return a;

    // Everything after position k is >= a, so the next order statistic is the
    // minimum of the upper partition.
    const double b = *std::min_element(v.begin() + k2, v.end());
    return a + frac * (b - a);
}

double percentile(std::vector<double> values, double p) {
    return quantile(std::move(values), p / 100.0);
}

double clamp01(double x) {
    if (!std::isfinite(x)) return x > 0.0 ? 1.0 : 0.0;
    return std::clamp(x, 0.0, 1.0);
}

} // namespace reelcut
