#pragma once

/**
 * CoreContract.h - ReelCut selection constants
 *
 * Fixed values that shape selection and part planning. Runtime-tunable
 * defaults live in Config.h; the constants below are not configurable
 * because stored runs and published schedules depend on them.
 *
 * VERSION: 1.0.0
 */

namespace reelcut {
namespace contract {

// ============================================================================
// Chat burst buckets
// ============================================================================

/**
 * Burst multiplier = peak per-second count / max(baseline rate, 1).
 *
 * The multiplier maps to a score by a monotonic step function. Each entry is
 * (minimum multiplier, score); the first matching row wins. Anything below
 * the last row scores CHAT_BURST_FLOOR_SCORE.
 */
struct BurstBucket {
    double minMultiplier;
    double score;
};

constexpr BurstBucket CHAT_BURST_BUCKETS[] = {
    {15.0, 1.00},
    {10.0, 0.95},
    {7.0, 0.85},
    {5.0, 0.70},
    {3.0, 0.50},
    {2.0, 0.30},
};

constexpr double CHAT_BURST_FLOOR_SCORE = 0.10;

/**
 * Baseline rates below one message per second are treated as one, so a
 * silent chat does not turn a single message into a huge multiplier.
 */
constexpr double CHAT_BASELINE_MIN_RATE = 1.0;

/**
 * Chat seconds are int keys. Timestamps past CHAT_MAX_SECOND are rejected on
 * load and segment bounds are clamped to it; window lengths are capped at
 * CHAT_MAX_WINDOW_SEC so window arithmetic stays inside int.
 */
constexpr int CHAT_MAX_SECOND = 2000000000;
constexpr double CHAT_MAX_WINDOW_SEC = 86400.0;

// ============================================================================
// Acoustic pre-score
// ============================================================================

/**
 * acoustic = 0.35*rms_z + 0.25*spectral_centroid_z + 0.20*speech_rate_wpm/200
 *          + 0.15*spectral_flux + 0.05*dramatic_pauses
 *
 * Clamped to [0,1] afterwards.
 */
constexpr double ACOUSTIC_W_RMS = 0.35;
constexpr double ACOUSTIC_W_CENTROID = 0.25;
constexpr double ACOUSTIC_W_SPEECH_RATE = 0.20;
constexpr double ACOUSTIC_W_FLUX = 0.15;
constexpr double ACOUSTIC_W_PAUSES = 0.05;
constexpr double SPEECH_RATE_NORM_WPM = 200.0;

constexpr double KEYWORD_SCORE_NORM = 10.0;           // keyword subscore = min(score/10, 1)
constexpr double KEYWORD_FALLBACK_SEMANTIC_NORM = 15.0; // semantic ~ min(score/15, 1) without assessor

constexpr double PRESCORE_W_ACOUSTIC = 0.6;
constexpr double PRESCORE_W_KEYWORD = 0.4;

// ============================================================================
// Part split ladder
// ============================================================================

constexpr double SPLIT_ONE_PART_BELOW_SEC = 3600.0;     // < 1h  -> 1 part
constexpr double SPLIT_TWO_PARTS_BELOW_SEC = 7200.0;    // < 2h  -> 2 parts
constexpr double SPLIT_THREE_PARTS_BELOW_SEC = 14400.0; // < 4h  -> 3 parts
constexpr double SPLIT_FOUR_PARTS_BELOW_SEC = 21600.0;  // < 6h  -> 4 parts
constexpr double SPLIT_SECONDS_PER_PART_BEYOND = 14400.0;
constexpr int SPLIT_MAX_PARTS = 6;

constexpr double SPLIT_PART_SHARE_OF_SOURCE = 0.10;
constexpr int PART_MIN_DURATION_SEC = 720;
constexpr int PART_MAX_DURATION_SEC = 1200;

/**
 * Score threshold ladder. "Long" sources (> 4h) and "very long" sources
 * (> 6h) can afford to be pickier.
 */
constexpr double SCORE_THRESHOLD_DEFAULT = 0.45;
constexpr double SCORE_THRESHOLD_LONG = 0.50;
constexpr double SCORE_THRESHOLD_VERY_LONG = 0.55;
constexpr double LONG_SOURCE_SEC = 14400.0;
constexpr double VERY_LONG_SOURCE_SEC = 21600.0;

// ============================================================================
// Bin-packing
// ============================================================================

constexpr double PACK_W_FILL = 0.6;
constexpr double PACK_W_QUALITY = 0.4;
constexpr double PACK_OVERFILL_RATIO = 1.15;

// ============================================================================
// Coverage scaling for long sources
// ============================================================================

constexpr double COVERAGE_VERY_LONG_SEC = 43200.0;  // 12h
constexpr double COVERAGE_LONG_SEC = 21600.0;       // 6h
constexpr int COVERAGE_BIN_CAP_VERY_LONG = 8;
constexpr int COVERAGE_BIN_CAP_LONG = 6;
constexpr int COVERAGE_FLOOR_VERY_LONG = 15;
constexpr int COVERAGE_FLOOR_LONG = 10;

// ============================================================================
// Titles
// ============================================================================

constexpr int TITLE_MAX_CODEPOINTS = 100;
constexpr const char* TITLE_ELLIPSIS = "...";
constexpr int TITLE_TOP_CLIPS = 5;
constexpr int TITLE_KEYWORDS_PER_CLIP = 3;
constexpr int PART_METADATA_KEYWORDS = 10;

// ============================================================================
// Version Tracking
// ============================================================================

/**
 * CORE_CONTRACT_VERSION - stored with every persisted run.
 */
constexpr const char* CORE_CONTRACT_VERSION = "1.0.0";

} // namespace contract
} // namespace reelcut
