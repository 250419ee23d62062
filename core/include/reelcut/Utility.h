#pragma once

#include "reelcut/ClipTypes.h"

#include <cstddef>
#include <string>

namespace reelcut {

std::string processing_mode_to_string(ProcessingMode mode);
ProcessingMode processing_mode_from_string(const std::string& value);

std::string run_status_to_string(RunStatus status);

// Feature lookup with a default for keys the feature source did not supply.
double feature_value(const std::unordered_map<std::string, double>& features,
                     const std::string& key,
                     double fallback = 0.0);

Clip clip_from_segment(const Segment& segment);
double total_duration(const std::vector<Clip>& clips);

// "1h 5m", "12m 3s", "42s"
std::string format_duration(double seconds);

// ---------- UTF-8 text helpers ----------
std::size_t utf8_length(const std::string& text);
std::string utf8_prefix(const std::string& text, std::size_t codepoints);
std::string ascii_lower(std::string text);
std::string capitalize_first(std::string text);

}  // namespace reelcut
