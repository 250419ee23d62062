#include "reelcut/JsonIO.h"
#include "reelcut/CoreContract.h"
#include "reelcut/Logging.h"
#include "reelcut/Utility.h"

#include <cmath>
#include <fstream>
#include <initializer_list>
#include <limits>
#include <stdexcept>

namespace reelcut {
namespace io {

using nlohmann::json;

namespace {

json read_document(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open " + path);
    }
    try {
        return json::parse(in);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Malformed JSON in " + path + ": " + e.what());
    }
}

// Ids may arrive as numbers from some feature sources.
std::string string_field(const json& obj, const char* key) {
    if (!obj.contains(key)) return {};
    const auto& value = obj.at(key);
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number()) return value.dump();
    return {};
}

double number_field(const json& obj, std::initializer_list<const char*> keys, double fallback) {
    for (const char* key : keys) {
        if (obj.contains(key) && obj.at(key).is_number()) {
            return obj.at(key).get<double>();
        }
    }
    return fallback;
}

std::vector<Keyword> parse_keywords(const json& list) {
    std::vector<Keyword> keywords;
    if (!list.is_array()) return keywords;
    for (const auto& item : list) {
        Keyword kw;
        if (item.is_string()) {
            kw.token = item.get<std::string>();
            kw.weight = 1.0;
        } else if (item.is_object()) {
            kw.token = item.contains("token") ? string_field(item, "token") : string_field(item, "keyword");
            kw.weight = number_field(item, {"weight", "score"}, 1.0);
            kw.category = string_field(item, "category");
        }
        if (!kw.token.empty()) keywords.push_back(std::move(kw));
    }
    return keywords;
}

const json* message_list(const json& doc) {
    if (doc.is_array()) return &doc;
    if (!doc.is_object()) return nullptr;
    for (const char* key : {"messages", "comments", "data", "chat"}) {
        if (doc.contains(key) && doc.at(key).is_array()) return &doc.at(key);
    }
    return nullptr;
}

template <typename T>
void read(const json& obj, const char* key, T& field) {
    if (obj.contains(key) && !obj.at(key).is_null()) {
        field = obj.at(key).get<T>();
    }
}

template <typename T>
void read_optional(const json& obj, const char* key, std::optional<T>& field) {
    if (obj.contains(key) && !obj.at(key).is_null()) {
        field = obj.at(key).get<T>();
    }
}

const json& section(const json& doc, const char* key) {
    static const json empty = json::object();
    if (doc.contains(key) && doc.at(key).is_object()) return doc.at(key);
    return empty;
}

json weights_to_json(const WeightProfile& w) {
    return json{{"name", w.name},
                {"chat_burst", w.chatBurst},
                {"acoustic", w.acoustic},
                {"semantic", w.semantic},
                {"prompt_boost", w.promptBoost}};
}

}  // namespace

std::vector<Segment> parse_segments(const json& doc) {
    const json* list = &doc;
    if (doc.is_object() && doc.contains("segments")) {
        list = &doc.at("segments");
    }
    if (!list->is_array()) {
        throw std::runtime_error("Segments document must be an array or hold a \"segments\" array");
    }

    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<Segment> segments;
    segments.reserve(list->size());
    for (const auto& item : *list) {
        if (!item.is_object()) {
            REELCUT_LOG_WARN("Skipping non-object segment entry");
            continue;
        }
        Segment seg;
        seg.id = string_field(item, "id");
        seg.t0 = number_field(item, {"t0", "start"}, nan);
        seg.t1 = number_field(item, {"t1", "end"}, nan);
        seg.duration = number_field(item, {"duration"}, seg.t1 - seg.t0);
        seg.transcript = string_field(item, "transcript");

        if (item.contains("features") && item.at("features").is_object()) {
            const auto& features = item.at("features");
            for (auto it = features.begin(); it != features.end(); ++it) {
                if (it.value().is_number()) {
                    seg.features[it.key()] = it.value().get<double>();
                }
            }
            if (features.contains("matched_keywords")) {
                seg.keywords = parse_keywords(features.at("matched_keywords"));
            }
        }
        if (item.contains("keywords")) {
            seg.keywords = parse_keywords(item.at("keywords"));
        }
        segments.push_back(std::move(seg));
    }
    return segments;
}

std::vector<Segment> load_segments(const std::string& path) {
    auto segments = parse_segments(read_document(path));
    REELCUT_LOG_INFO("Loaded " << segments.size() << " segments from " << path);
    return segments;
}

ChatHistogram parse_chat_histogram(const json& doc) {
    ChatHistogram histogram;
    const json* list = message_list(doc);
    if (!list) {
        REELCUT_LOG_WARN("Chat document has no message list; chat signal disabled");
        return histogram;
    }

    int skipped = 0;
    for (const auto& message : *list) {
        double t = -1.0;
        if (message.is_number()) {
            t = message.get<double>();
        } else if (message.is_object()) {
            t = number_field(message, {"timestamp", "time", "offset", "offsetSeconds"}, -1.0);
            if (t < 0.0 && message.contains("timestamp_ms") && message.at("timestamp_ms").is_number()) {
                t = message.at("timestamp_ms").get<double>() / 1000.0;
            }
        }
        if (t > 1e12) t /= 1000.0;
        if (!std::isfinite(t) || t < 0.0 || t > contract::CHAT_MAX_SECOND) {
            ++skipped;
            continue;
        }
        ++histogram[static_cast<int>(std::floor(t))];
    }
    if (skipped > 0) {
        REELCUT_LOG_DEBUG("Skipped " << skipped << " chat messages without a usable timestamp");
    }
    return histogram;
}

ChatHistogram load_chat_histogram(const std::string& path) {
    try {
        return parse_chat_histogram(read_document(path));
    } catch (const std::runtime_error& e) {
        REELCUT_LOG_WARN("Chat unavailable (" << e.what() << "); chat signal disabled");
        return {};
    }
}

std::unordered_map<std::string, double> load_semantic_table(const std::string& path) {
    const json doc = read_document(path);
    if (!doc.is_object()) {
        throw std::runtime_error("Semantic table must be an object of id -> score: " + path);
    }
    std::unordered_map<std::string, double> table;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (it.value().is_number()) {
            table[it.key()] = it.value().get<double>();
        }
    }
    return table;
}

PipelineConfig parse_config(const json& doc) {
    PipelineConfig config;
    try {
        if (doc.contains("mode")) {
            config.mode = processing_mode_from_string(doc.at("mode").get<std::string>());
        }

        if (doc.contains("weights") && doc.at("weights").is_object()) {
            const auto& w = doc.at("weights");
            WeightProfile profile;
            profile.name = "custom";
            read(w, "name", profile.name);
            read(w, "chat_burst", profile.chatBurst);
            read(w, "acoustic", profile.acoustic);
            read(w, "semantic", profile.semantic);
            read(w, "prompt_boost", profile.promptBoost);
            config.weightOverride = profile;
        }

        const auto& scoring = section(doc, "scoring");
        read(scoring, "prefilter_top_n", config.scoring.prefilterTopN);
        read(scoring, "keyword_force_threshold", config.scoring.keywordForceThreshold);
        read(scoring, "semantic_batch_size", config.scoring.semanticBatchSize);
        read(scoring, "neutral_semantic_score", config.scoring.neutralSemanticScore);
        read(scoring, "transcript_char_limit", config.scoring.transcriptCharLimit);
        read(scoring, "diversity_bonus", config.scoring.diversityBonus);
        read(scoring, "chat_baseline_window", config.scoring.chatBaselineWindow);
        read(scoring, "chat_peak_extension", config.scoring.chatPeakExtension);

        const auto& sel = section(doc, "selection");
        auto& s = config.selection;
        read(sel, "min_segment_duration", s.minSegmentDuration);
        read(sel, "burst_merge_gap", s.burstMergeGap);
        read(sel, "min_clip_duration", s.minClipDuration);
        read(sel, "max_clip_duration", s.maxClipDuration);
        read(sel, "target_total_duration", s.targetTotalDuration);
        read(sel, "min_clips", s.minClips);
        read(sel, "max_clips", s.maxClips);
        read(sel, "min_score_threshold", s.minScoreThreshold);
        read(sel, "fallback_percentile", s.fallbackPercentile);
        read(sel, "relax_step", s.relaxStep);
        read(sel, "relax_min_pool_size", s.relaxMinPoolSize);
        read(sel, "relax_min_coverage", s.relaxMinCoverage);
        read(sel, "min_time_gap", s.minTimeGap);
        read(sel, "overshoot_ceiling", s.overshootCeiling);
        read(sel, "smart_merge_gap", s.smartMergeGap);
        read(sel, "smart_merge_min_score", s.smartMergeMinScore);
        read(sel, "force_merge_coverage", s.forceMergeCoverage);
        read(sel, "force_merge_ceiling", s.forceMergeCeiling);
        read(sel, "position_bins", s.positionBins);
        read(sel, "max_clips_per_bin", s.maxClipsPerBin);
        read(sel, "duration_tolerance", s.durationTolerance);
        read(sel, "trim_trigger_slack", s.trimTriggerSlack);
        read(sel, "trim_percentage", s.trimPercentage);
        read(sel, "min_duration_guard", s.minDurationGuard);
        read(sel, "top_up_hard_cap", s.topUpHardCap);
        read(sel, "top_up_min_duration_factor", s.topUpMinDurationFactor);
        read(sel, "top_up_ceiling", s.topUpCeiling);

        const auto& shorts = section(doc, "shorts");
        read(shorts, "enabled", config.shorts.enabled);
        read(shorts, "count", config.shorts.count);
        read(shorts, "min_duration", config.shorts.minDuration);
        read(shorts, "max_duration", config.shorts.maxDuration);

        const auto& splitter = section(doc, "splitter");
        read(splitter, "enabled", config.splitter.enabled);
        read(splitter, "min_duration_for_split", config.splitter.minDurationForSplit);
        read_optional(splitter, "override_parts", config.splitter.overrideParts);
        read_optional(splitter, "override_target_minutes", config.splitter.overrideTargetMinutes);
        read(splitter, "publish_hour", config.splitter.publishHour);
        read(splitter, "publish_minute", config.splitter.publishMinute);
        read(splitter, "first_publish_day_offset", config.splitter.firstPublishDayOffset);

        const auto& titles = section(doc, "titles");
        read(titles, "political_context", config.titles.politicalContext);
        read(titles, "stream_context", config.titles.streamContext);
        read(titles, "entity_names", config.titles.entityNames);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid configuration value: ") + e.what());
    } catch (const std::runtime_error& e) {
        throw ConfigError(e.what());
    }

    config.validate();
    return config;
}

PipelineConfig load_config(const std::string& path) {
    return parse_config(read_document(path));
}

json clip_to_json(const Clip& clip) {
    json keywords = json::array();
    for (const auto& kw : clip.keywords) {
        keywords.push_back(json{{"token", kw.token}, {"weight", kw.weight}, {"category", kw.category}});
    }
    return json{{"clip_id", clip.clipId},
                {"id", clip.id},
                {"title", clip.title},
                {"t0", clip.t0},
                {"t1", clip.t1},
                {"duration", clip.duration},
                {"final_score", clip.finalScore},
                {"subscores",
                 {{"acoustic", clip.subscores.acoustic},
                  {"keyword", clip.subscores.keyword},
                  {"semantic", clip.subscores.semantic},
                  {"chat_burst", clip.subscores.chatBurst},
                  {"prompt_similarity", clip.subscores.promptSimilarity}}},
                {"merged_from", clip.mergedFrom},
                {"keywords", keywords},
                {"transcript", clip.transcript}};
}

json result_to_json(const RunResult& result) {
    json doc;
    doc["run_id"] = result.runId;
    doc["status"] = run_status_to_string(result.status);
    doc["mode"] = processing_mode_to_string(result.mode);
    doc["contract_version"] = contract::CORE_CONTRACT_VERSION;
    doc["source_duration"] = result.sourceDuration;
    doc["weights"] = weights_to_json(result.weights);
    doc["rejected_segments"] = result.rejectedSegments;
    doc["total_duration"] = total_duration(result.clips);
    doc["notes"] = result.notes;

    doc["clips"] = json::array();
    for (const auto& clip : result.clips) doc["clips"].push_back(clip_to_json(clip));
    doc["shorts"] = json::array();
    for (const auto& clip : result.shorts) doc["shorts"].push_back(clip_to_json(clip));

    if (result.plan) {
        const auto& plan = *result.plan;
        json parts = json::array();
        for (const auto& part : plan.parts) {
            json clipIds = json::array();
            for (const auto& clip : part.clips) clipIds.push_back(clip.clipId);
            parts.push_back(json{{"part_number", part.partNumber},
                                 {"total_parts", part.totalParts},
                                 {"duration", part.duration},
                                 {"avg_score", part.avgScore},
                                 {"publish_at", part.publishAt},
                                 {"title", part.title},
                                 {"keywords", part.keywords},
                                 {"filename_suffix", part.filenameSuffix},
                                 {"clip_ids", clipIds}});
        }
        doc["split_plan"] = json{{"source_duration", plan.sourceDuration},
                                 {"num_parts", plan.numParts},
                                 {"target_duration_per_part", plan.targetDurationPerPart},
                                 {"total_target_duration", plan.totalTargetDuration},
                                 {"min_score_threshold", plan.minScoreThreshold},
                                 {"compression_ratio", plan.compressionRatio},
                                 {"reason", plan.reason},
                                 {"parts", parts}};
    } else {
        doc["split_plan"] = nullptr;
    }
    return doc;
}

void write_result(const RunResult& result, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot write " + path);
    }
    out << result_to_json(result).dump(2) << "\n";
    if (!out) {
        throw std::runtime_error("Failed writing " + path);
    }
}

}  // namespace io
}  // namespace reelcut
