#include "reelcut/Utility.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace reelcut {

std::string processing_mode_to_string(ProcessingMode mode) {
    switch (mode) {
        case ProcessingMode::PoliticalSession:
            return "political";
        case ProcessingMode::LiveStream:
            return "stream";
    }
    return "political";
}

ProcessingMode processing_mode_from_string(const std::string& value) {
    if (value == "political" || value == "sejm") {
        return ProcessingMode::PoliticalSession;
    }
    if (value == "stream") {
        return ProcessingMode::LiveStream;
    }
    throw std::runtime_error("Unknown processing mode: " + value);
}

std::string run_status_to_string(RunStatus status) {
    switch (status) {
        case RunStatus::Completed:
            return "completed";
        case RunStatus::NoCandidates:
            return "no_candidates";
        case RunStatus::Cancelled:
            return "cancelled";
        case RunStatus::Busy:
            return "busy";
    }
    return "completed";
}

double feature_value(const std::unordered_map<std::string, double>& features,
                     const std::string& key,
                     double fallback) {
    const auto it = features.find(key);
    if (it == features.end() || !std::isfinite(it->second)) {
        return fallback;
    }
    return it->second;
}

Clip clip_from_segment(const Segment& segment) {
    Clip clip;
    clip.id = segment.id;
    clip.t0 = segment.t0;
    clip.t1 = segment.t1;
    clip.duration = segment.t1 - segment.t0;
    clip.finalScore = segment.finalScore;
    clip.transcript = segment.transcript;
    clip.features = segment.features;
    clip.keywords = segment.keywords;
    clip.subscores = segment.subscores;
    clip.mergedFrom = {segment.id};
    return clip;
}

double total_duration(const std::vector<Clip>& clips) {
    return std::accumulate(clips.begin(), clips.end(), 0.0,
                           [](double acc, const Clip& c) { return acc + c.duration; });
}

std::string format_duration(double seconds) {
    const long total = std::lround(std::max(0.0, seconds));
    const long hours = total / 3600;
    const long minutes = (total % 3600) / 60;
    const long secs = total % 60;
    if (hours > 0) {
        return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
    }
    if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

std::size_t utf8_length(const std::string& text) {
    std::size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

std::string utf8_prefix(const std::string& text, std::size_t codepoints) {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) != 0x80) {
            if (seen == codepoints) return text.substr(0, i);
            ++seen;
        }
    }
    return text;
}

std::string ascii_lower(std::string text) {
    for (auto& ch : text) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return text;
}

std::string capitalize_first(std::string text) {
    if (!text.empty()) {
        text[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
    }
    return text;
}

}  // namespace reelcut
