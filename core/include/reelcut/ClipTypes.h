#pragma once

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace reelcut {

// ========== Processing mode ==========
enum class ProcessingMode {
    PoliticalSession,
    LiveStream
};

// ========== Lexical match (from the upstream keyword extractor) ==========
struct Keyword {
    std::string token;
    double weight{0.0};
    std::string category;
};

// ========== Per-signal subscores, each in [0,1] ==========
struct Subscores {
    double acoustic{0.0};
    double keyword{0.0};
    double semantic{0.0};
    double chatBurst{0.0};
    double promptSimilarity{0.0};
};

// ========== Segment: atomic scored unit of source time ==========
struct Segment {
    std::string id;                 // unique; "a+b" after merges
    double t0{0.0};
    double t1{0.0};
    double duration{0.0};           // always t1 - t0
    std::string transcript;

    // Open-ended acoustic/lexical attributes supplied by the feature source
    // (rms_z, spectral_centroid_z, speech_rate_wpm, keyword_score, ...).
    std::unordered_map<std::string, double> features;
    std::vector<Keyword> keywords;  // matched keywords, highest weight first

    Subscores subscores;
    double preScore{0.0};           // cheap acoustic+keyword heuristic
    double finalScore{0.0};         // composite in [0,1], set by SignalAggregator
};

// ========== Clip: a segment (or merge of segments) promoted to output ==========
struct Clip {
    std::string id;                 // source segment id, "a+b" when merged
    std::string clipId;             // output numbering: clip_001, clip_002, ...
    std::string title;
    double t0{0.0};
    double t1{0.0};
    double duration{0.0};
    double finalScore{0.0};
    std::string transcript;
    std::unordered_map<std::string, double> features;
    std::vector<Keyword> keywords;
    Subscores subscores;
    std::vector<std::string> mergedFrom;  // constituent segment ids, in time order
};

// ========== Weight profile ==========
struct WeightProfile {
    std::string name;
    double chatBurst{0.0};
    double acoustic{0.0};
    double semantic{0.0};
    double promptBoost{0.0};
};

// Per-second chat message counts, keyed by whole second from source start.
using ChatHistogram = std::map<int, int>;

// ========== Part splitting ==========
struct PartPlan {
    int partNumber{1};              // 1-based
    int totalParts{1};
    std::vector<Clip> clips;        // chronological
    double duration{0.0};
    double avgScore{0.0};
    std::string publishAt;          // ISO-8601 local time, "YYYY-MM-DDTHH:MM:00"
    std::string title;
    std::vector<std::string> keywords;
    std::string filenameSuffix;     // "_part1of3", empty for single-part plans
};

struct SplitPlan {
    double sourceDuration{0.0};
    int numParts{1};
    int targetDurationPerPart{0};   // seconds
    int totalTargetDuration{0};     // seconds
    double minScoreThreshold{0.45};
    double compressionRatio{0.0};
    std::string reason;
    std::vector<PartPlan> parts;    // filled after selection
};

// ========== Run outcome ==========
enum class RunStatus {
    Completed,
    NoCandidates,   // nothing survived input validation; not an error
    Cancelled,
    Busy            // another run holds the engine
};

struct RunResult {
    std::string runId;
    RunStatus status{RunStatus::Completed};
    ProcessingMode mode{ProcessingMode::PoliticalSession};
    double sourceDuration{0.0};
    WeightProfile weights;          // effective profile used for scoring
    int rejectedSegments{0};
    std::vector<Segment> scored;    // every accepted input segment, with subscores
    std::vector<Clip> clips;        // final, chronological
    std::vector<Clip> shorts;
    std::optional<SplitPlan> plan;  // present when the source was split
    std::vector<std::string> notes; // fallback and relaxation decisions, in order
};

}  // namespace reelcut
