#pragma once
#include <vector>
#include <cstddef>

namespace reelcut {

// ---------- statistics over score lists ----------
double mean(const std::vector<double>& v);             // 0 for empty input
double quantile(std::vector<double> values, double q); // linear interpolation, q in [0,1]
double percentile(std::vector<double> values, double p); // p in [0,100]

// ---------- scalar helpers ----------
double clamp01(double x);                              // NaN maps to 0

} // namespace reelcut
