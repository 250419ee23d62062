#pragma once

#include "reelcut/ClipTypes.h"
#include "reelcut/Config.h"

#include <nlohmann/json.hpp>

#include <string>
#include <unordered_map>
#include <vector>

namespace reelcut {
namespace io {

// ---------- Input documents ----------

// Array of segments, or an object holding a "segments" array.
// Throws std::runtime_error when the file cannot be read or parsed.
std::vector<Segment> load_segments(const std::string& path);
std::vector<Segment> parse_segments(const nlohmann::json& doc);

// Missing or malformed chat files yield an empty histogram and a warning.
ChatHistogram load_chat_histogram(const std::string& path);
ChatHistogram parse_chat_histogram(const nlohmann::json& doc);

// {"segment_id": score, ...}
std::unordered_map<std::string, double> load_semantic_table(const std::string& path);

// Keys are optional over the defaults; the result is validated (ConfigError).
PipelineConfig load_config(const std::string& path);
PipelineConfig parse_config(const nlohmann::json& doc);

// ---------- Output document ----------

nlohmann::json clip_to_json(const Clip& clip);
nlohmann::json result_to_json(const RunResult& result);
void write_result(const RunResult& result, const std::string& path);

}  // namespace io
}  // namespace reelcut
