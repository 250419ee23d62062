#include "reelcut/SQLiteStore.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "reelcut/CoreContract.h"
#include "reelcut/Logging.h"
#include "reelcut/Utility.h"

namespace reelcut {

namespace {

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

void exec_or_throw(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "Unknown sqlite error";
        sqlite3_free(err);
        throw std::runtime_error(message);
    }
}

StatementPtr prepare_or_throw(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(sqlite3_errmsg(db));
    }
    return StatementPtr(stmt, &sqlite3_finalize);
}

void step_done_or_throw(sqlite3* db, sqlite3_stmt* stmt) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw std::runtime_error(sqlite3_errmsg(db));
    }
    sqlite3_reset(stmt);
}

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt* stmt, int index) {
    const unsigned char* text = sqlite3_column_text(stmt, index);
    return text ? reinterpret_cast<const char*>(text) : std::string{};
}

// String lists are stored as JSON arrays so any token survives the round trip.
std::string encode_list(const std::vector<std::string>& items) {
    return nlohmann::json(items).dump();
}

std::vector<std::string> decode_list(const std::string& text) {
    if (text.empty()) return {};
    try {
        return nlohmann::json::parse(text).get<std::vector<std::string>>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Corrupt list column '" + text + "': " + e.what());
    }
}

void delete_for_run(sqlite3* db, const char* table, int runKey) {
    auto stmt = prepare_or_throw(db, std::string("DELETE FROM ") + table + " WHERE run_fk=?;");
    sqlite3_bind_int(stmt.get(), 1, runKey);
    step_done_or_throw(db, stmt.get());
}

void insert_clips(sqlite3* db, int runKey, const std::vector<Clip>& clips, const char* kind) {
    auto stmt = prepare_or_throw(db,
        "INSERT INTO clips (run_fk, kind, clip_id, segment_id, t0, t1, duration, final_score, "
        "acoustic, semantic, chat_burst, prompt_similarity, title, merged_from, transcript) "
        "VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");

    for (const auto& clip : clips) {
        sqlite3_bind_int(stmt.get(), 1, runKey);
        sqlite3_bind_text(stmt.get(), 2, kind, -1, SQLITE_TRANSIENT);
        bind_text(stmt.get(), 3, clip.clipId);
        bind_text(stmt.get(), 4, clip.id);
        sqlite3_bind_double(stmt.get(), 5, clip.t0);
        sqlite3_bind_double(stmt.get(), 6, clip.t1);
        sqlite3_bind_double(stmt.get(), 7, clip.duration);
        sqlite3_bind_double(stmt.get(), 8, clip.finalScore);
        sqlite3_bind_double(stmt.get(), 9, clip.subscores.acoustic);
        sqlite3_bind_double(stmt.get(), 10, clip.subscores.semantic);
        sqlite3_bind_double(stmt.get(), 11, clip.subscores.chatBurst);
        sqlite3_bind_double(stmt.get(), 12, clip.subscores.promptSimilarity);
        bind_text(stmt.get(), 13, clip.title);
        bind_text(stmt.get(), 14, encode_list(clip.mergedFrom));
        bind_text(stmt.get(), 15, clip.transcript);
        step_done_or_throw(db, stmt.get());
    }
}

}  // namespace

SQLiteStore::SQLiteStore(const std::string& path) {
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open SQLite database at " + path + ": " + message);
    }
}

SQLiteStore::~SQLiteStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SQLiteStore::initialize() {
    const char* schema = R"SQL(
        PRAGMA journal_mode=WAL;

        CREATE TABLE IF NOT EXISTS runs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            run_id TEXT NOT NULL UNIQUE,
            mode TEXT NOT NULL,
            status TEXT NOT NULL,
            source_duration REAL,
            weights_name TEXT,
            w_chat_burst REAL,
            w_acoustic REAL,
            w_semantic REAL,
            w_prompt_boost REAL,
            rejected_segments INTEGER,
            contract_version TEXT,
            notes TEXT,
            created_at TEXT DEFAULT CURRENT_TIMESTAMP,
            updated_at TEXT DEFAULT CURRENT_TIMESTAMP
        );

        CREATE INDEX IF NOT EXISTS idx_runs_updated ON runs(updated_at);

        CREATE TRIGGER IF NOT EXISTS update_runs_timestamp
            AFTER UPDATE ON runs FOR EACH ROW
        BEGIN
            UPDATE runs SET updated_at = CURRENT_TIMESTAMP WHERE id = NEW.id;
        END;

        CREATE TABLE IF NOT EXISTS scored_segments (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            run_fk INTEGER NOT NULL,
            segment_id TEXT NOT NULL,
            t0 REAL NOT NULL,
            t1 REAL NOT NULL,
            acoustic REAL,
            keyword REAL,
            semantic REAL,
            chat_burst REAL,
            prompt_similarity REAL,
            pre_score REAL,
            final_score REAL NOT NULL,
            FOREIGN KEY(run_fk) REFERENCES runs(id) ON DELETE CASCADE
        );

        CREATE INDEX IF NOT EXISTS idx_scored_segments_run ON scored_segments(run_fk);

        -- kind: "main" for the highlight reel, "short" for vertical candidates
        CREATE TABLE IF NOT EXISTS clips (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            run_fk INTEGER NOT NULL,
            kind TEXT NOT NULL,
            clip_id TEXT NOT NULL,
            segment_id TEXT NOT NULL,
            t0 REAL NOT NULL,
            t1 REAL NOT NULL,
            duration REAL NOT NULL,
            final_score REAL NOT NULL,
            acoustic REAL,
            semantic REAL,
            chat_burst REAL,
            prompt_similarity REAL,
            title TEXT,
            merged_from TEXT,
            transcript TEXT,
            FOREIGN KEY(run_fk) REFERENCES runs(id) ON DELETE CASCADE
        );

        CREATE INDEX IF NOT EXISTS idx_clips_run ON clips(run_fk, kind);

        CREATE TABLE IF NOT EXISTS split_plans (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            run_fk INTEGER NOT NULL UNIQUE,
            source_duration REAL NOT NULL,
            num_parts INTEGER NOT NULL,
            target_duration_per_part INTEGER NOT NULL,
            total_target_duration INTEGER NOT NULL,
            min_score_threshold REAL NOT NULL,
            compression_ratio REAL NOT NULL,
            reason TEXT,
            FOREIGN KEY(run_fk) REFERENCES runs(id) ON DELETE CASCADE
        );

        CREATE TABLE IF NOT EXISTS parts (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            run_fk INTEGER NOT NULL,
            part_number INTEGER NOT NULL,
            total_parts INTEGER NOT NULL,
            duration REAL NOT NULL,
            avg_score REAL NOT NULL,
            publish_at TEXT NOT NULL,
            title TEXT NOT NULL,
            keywords TEXT,
            filename_suffix TEXT,
            FOREIGN KEY(run_fk) REFERENCES runs(id) ON DELETE CASCADE
        );

        CREATE INDEX IF NOT EXISTS idx_parts_run ON parts(run_fk);

        CREATE TABLE IF NOT EXISTS part_clips (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            run_fk INTEGER NOT NULL,
            part_number INTEGER NOT NULL,
            position INTEGER NOT NULL,
            clip_id TEXT NOT NULL,
            FOREIGN KEY(run_fk) REFERENCES runs(id) ON DELETE CASCADE
        );

        CREATE INDEX IF NOT EXISTS idx_part_clips_run ON part_clips(run_fk, part_number);
    )SQL";

    exec_or_throw(db_, schema);
}

void SQLiteStore::save_run(const RunResult& result) {
    exec_or_throw(db_, "BEGIN TRANSACTION;");
    try {
        // Insert run record with UPSERT on run_id
        int run_fk = -1;
        {
            auto stmt = prepare_or_throw(db_,
                "INSERT INTO runs (run_id, mode, status, source_duration, weights_name, w_chat_burst, w_acoustic, "
                "w_semantic, w_prompt_boost, rejected_segments, contract_version, notes, updated_at) "
                "VALUES (?,?,?,?,?,?,?,?,?,?,?,?, CURRENT_TIMESTAMP) "
                "ON CONFLICT(run_id) DO UPDATE SET "
                "mode=excluded.mode, status=excluded.status, source_duration=excluded.source_duration, "
                "weights_name=excluded.weights_name, w_chat_burst=excluded.w_chat_burst, "
                "w_acoustic=excluded.w_acoustic, w_semantic=excluded.w_semantic, "
                "w_prompt_boost=excluded.w_prompt_boost, rejected_segments=excluded.rejected_segments, "
                "contract_version=excluded.contract_version, notes=excluded.notes, updated_at=CURRENT_TIMESTAMP "
                "RETURNING id;");

            std::string notes;
            for (const auto& note : result.notes) {
                if (!notes.empty()) notes += "\n";
                notes += note;
            }

            bind_text(stmt.get(), 1, result.runId);
            bind_text(stmt.get(), 2, processing_mode_to_string(result.mode));
            bind_text(stmt.get(), 3, run_status_to_string(result.status));
            sqlite3_bind_double(stmt.get(), 4, result.sourceDuration);
            bind_text(stmt.get(), 5, result.weights.name);
            sqlite3_bind_double(stmt.get(), 6, result.weights.chatBurst);
            sqlite3_bind_double(stmt.get(), 7, result.weights.acoustic);
            sqlite3_bind_double(stmt.get(), 8, result.weights.semantic);
            sqlite3_bind_double(stmt.get(), 9, result.weights.promptBoost);
            sqlite3_bind_int(stmt.get(), 10, result.rejectedSegments);
            sqlite3_bind_text(stmt.get(), 11, contract::CORE_CONTRACT_VERSION, -1, SQLITE_TRANSIENT);
            bind_text(stmt.get(), 12, notes);

            if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
                run_fk = sqlite3_column_int(stmt.get(), 0);
            }
        }

        if (run_fk < 0) {
            throw std::runtime_error("Failed to insert/get run id for " + result.runId);
        }

        // Replace everything previously stored for this run
        for (const char* table : {"scored_segments", "clips", "split_plans", "parts", "part_clips"}) {
            delete_for_run(db_, table, run_fk);
        }

        // Scored segments
        {
            auto stmt = prepare_or_throw(db_,
                "INSERT INTO scored_segments (run_fk, segment_id, t0, t1, acoustic, keyword, semantic, chat_burst, "
                "prompt_similarity, pre_score, final_score) VALUES (?,?,?,?,?,?,?,?,?,?,?);");
            for (const auto& seg : result.scored) {
                sqlite3_bind_int(stmt.get(), 1, run_fk);
                bind_text(stmt.get(), 2, seg.id);
                sqlite3_bind_double(stmt.get(), 3, seg.t0);
                sqlite3_bind_double(stmt.get(), 4, seg.t1);
                sqlite3_bind_double(stmt.get(), 5, seg.subscores.acoustic);
                sqlite3_bind_double(stmt.get(), 6, seg.subscores.keyword);
                sqlite3_bind_double(stmt.get(), 7, seg.subscores.semantic);
                sqlite3_bind_double(stmt.get(), 8, seg.subscores.chatBurst);
                sqlite3_bind_double(stmt.get(), 9, seg.subscores.promptSimilarity);
                sqlite3_bind_double(stmt.get(), 10, seg.preScore);
                sqlite3_bind_double(stmt.get(), 11, seg.finalScore);
                step_done_or_throw(db_, stmt.get());
            }
        }

        insert_clips(db_, run_fk, result.clips, "main");
        insert_clips(db_, run_fk, result.shorts, "short");

        // Split plan and parts
        if (result.plan) {
            const SplitPlan& plan = *result.plan;
            {
                auto stmt = prepare_or_throw(db_,
                    "INSERT INTO split_plans (run_fk, source_duration, num_parts, target_duration_per_part, "
                    "total_target_duration, min_score_threshold, compression_ratio, reason) VALUES (?,?,?,?,?,?,?,?);");
                sqlite3_bind_int(stmt.get(), 1, run_fk);
                sqlite3_bind_double(stmt.get(), 2, plan.sourceDuration);
                sqlite3_bind_int(stmt.get(), 3, plan.numParts);
                sqlite3_bind_int(stmt.get(), 4, plan.targetDurationPerPart);
                sqlite3_bind_int(stmt.get(), 5, plan.totalTargetDuration);
                sqlite3_bind_double(stmt.get(), 6, plan.minScoreThreshold);
                sqlite3_bind_double(stmt.get(), 7, plan.compressionRatio);
                bind_text(stmt.get(), 8, plan.reason);
                step_done_or_throw(db_, stmt.get());
            }

            auto partStmt = prepare_or_throw(db_,
                "INSERT INTO parts (run_fk, part_number, total_parts, duration, avg_score, publish_at, title, "
                "keywords, filename_suffix) VALUES (?,?,?,?,?,?,?,?,?);");
            auto linkStmt = prepare_or_throw(db_,
                "INSERT INTO part_clips (run_fk, part_number, position, clip_id) VALUES (?,?,?,?);");

            for (const auto& part : plan.parts) {
                sqlite3_bind_int(partStmt.get(), 1, run_fk);
                sqlite3_bind_int(partStmt.get(), 2, part.partNumber);
                sqlite3_bind_int(partStmt.get(), 3, part.totalParts);
                sqlite3_bind_double(partStmt.get(), 4, part.duration);
                sqlite3_bind_double(partStmt.get(), 5, part.avgScore);
                bind_text(partStmt.get(), 6, part.publishAt);
                bind_text(partStmt.get(), 7, part.title);
                bind_text(partStmt.get(), 8, encode_list(part.keywords));
                bind_text(partStmt.get(), 9, part.filenameSuffix);
                step_done_or_throw(db_, partStmt.get());

                int position = 0;
                for (const auto& clip : part.clips) {
                    sqlite3_bind_int(linkStmt.get(), 1, run_fk);
                    sqlite3_bind_int(linkStmt.get(), 2, part.partNumber);
                    sqlite3_bind_int(linkStmt.get(), 3, position++);
                    bind_text(linkStmt.get(), 4, clip.clipId);
                    step_done_or_throw(db_, linkStmt.get());
                }
            }
        }

        exec_or_throw(db_, "COMMIT;");
    } catch (...) {
        REELCUT_LOG_ERROR("Saving run " << result.runId << " failed; rolling back");
        exec_or_throw(db_, "ROLLBACK;");
        throw;
    }
}

int SQLiteStore::run_key(const std::string& runId) {
    auto stmt = prepare_or_throw(db_, "SELECT id FROM runs WHERE run_id=?;");
    bind_text(stmt.get(), 1, runId);
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return sqlite3_column_int(stmt.get(), 0);
    }
    return -1;
}

std::optional<StoredRun> SQLiteStore::load_run(const std::string& runId) {
    auto stmt = prepare_or_throw(db_,
        "SELECT run_id, mode, status, source_duration, weights_name, w_chat_burst, w_acoustic, w_semantic, "
        "w_prompt_boost, rejected_segments, contract_version FROM runs WHERE run_id=?;");
    bind_text(stmt.get(), 1, runId);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    StoredRun run;
    run.runId = column_text(stmt.get(), 0);
    run.mode = column_text(stmt.get(), 1);
    run.status = column_text(stmt.get(), 2);
    run.sourceDuration = sqlite3_column_double(stmt.get(), 3);
    run.weights.name = column_text(stmt.get(), 4);
    run.weights.chatBurst = sqlite3_column_double(stmt.get(), 5);
    run.weights.acoustic = sqlite3_column_double(stmt.get(), 6);
    run.weights.semantic = sqlite3_column_double(stmt.get(), 7);
    run.weights.promptBoost = sqlite3_column_double(stmt.get(), 8);
    run.rejectedSegments = sqlite3_column_int(stmt.get(), 9);
    run.contractVersion = column_text(stmt.get(), 10);
    return run;
}

std::vector<Clip> SQLiteStore::load_clips(const std::string& runId, const std::string& kind) {
    std::vector<Clip> clips;
    const int key = run_key(runId);
    if (key < 0) return clips;

    auto stmt = prepare_or_throw(db_,
        "SELECT clip_id, segment_id, t0, t1, duration, final_score, acoustic, semantic, chat_burst, "
        "prompt_similarity, title, merged_from, transcript FROM clips WHERE run_fk=? AND kind=? ORDER BY t0;");
    sqlite3_bind_int(stmt.get(), 1, key);
    bind_text(stmt.get(), 2, kind);

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        Clip clip;
        clip.clipId = column_text(stmt.get(), 0);
        clip.id = column_text(stmt.get(), 1);
        clip.t0 = sqlite3_column_double(stmt.get(), 2);
        clip.t1 = sqlite3_column_double(stmt.get(), 3);
        clip.duration = sqlite3_column_double(stmt.get(), 4);
        clip.finalScore = sqlite3_column_double(stmt.get(), 5);
        clip.subscores.acoustic = sqlite3_column_double(stmt.get(), 6);
        clip.subscores.semantic = sqlite3_column_double(stmt.get(), 7);
        clip.subscores.chatBurst = sqlite3_column_double(stmt.get(), 8);
        clip.subscores.promptSimilarity = sqlite3_column_double(stmt.get(), 9);
        clip.title = column_text(stmt.get(), 10);
        clip.mergedFrom = decode_list(column_text(stmt.get(), 11));
        clip.transcript = column_text(stmt.get(), 12);
        clips.push_back(std::move(clip));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(sqlite3_errmsg(db_));
    }
    return clips;
}

std::optional<SplitPlan> SQLiteStore::load_split_plan(const std::string& runId) {
    const int key = run_key(runId);
    if (key < 0) return std::nullopt;

    SplitPlan plan;
    {
        auto stmt = prepare_or_throw(db_,
            "SELECT source_duration, num_parts, target_duration_per_part, total_target_duration, "
            "min_score_threshold, compression_ratio, reason FROM split_plans WHERE run_fk=?;");
        sqlite3_bind_int(stmt.get(), 1, key);
        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            return std::nullopt;
        }
        plan.sourceDuration = sqlite3_column_double(stmt.get(), 0);
        plan.numParts = sqlite3_column_int(stmt.get(), 1);
        plan.targetDurationPerPart = sqlite3_column_int(stmt.get(), 2);
        plan.totalTargetDuration = sqlite3_column_int(stmt.get(), 3);
        plan.minScoreThreshold = sqlite3_column_double(stmt.get(), 4);
        plan.compressionRatio = sqlite3_column_double(stmt.get(), 5);
        plan.reason = column_text(stmt.get(), 6);
    }

    std::unordered_map<std::string, Clip> byId;
    for (auto& clip : load_clips(runId, "main")) {
        std::string id = clip.clipId;
        byId.emplace(std::move(id), std::move(clip));
    }

    auto partStmt = prepare_or_throw(db_,
        "SELECT part_number, total_parts, duration, avg_score, publish_at, title, keywords, filename_suffix "
        "FROM parts WHERE run_fk=? ORDER BY part_number;");
    auto linkStmt = prepare_or_throw(db_,
        "SELECT clip_id FROM part_clips WHERE run_fk=? AND part_number=? ORDER BY position;");
    sqlite3_bind_int(partStmt.get(), 1, key);

    while (sqlite3_step(partStmt.get()) == SQLITE_ROW) {
        PartPlan part;
        part.partNumber = sqlite3_column_int(partStmt.get(), 0);
        part.totalParts = sqlite3_column_int(partStmt.get(), 1);
        part.duration = sqlite3_column_double(partStmt.get(), 2);
        part.avgScore = sqlite3_column_double(partStmt.get(), 3);
        part.publishAt = column_text(partStmt.get(), 4);
        part.title = column_text(partStmt.get(), 5);
        part.keywords = decode_list(column_text(partStmt.get(), 6));
        part.filenameSuffix = column_text(partStmt.get(), 7);

        sqlite3_bind_int(linkStmt.get(), 1, key);
        sqlite3_bind_int(linkStmt.get(), 2, part.partNumber);
        while (sqlite3_step(linkStmt.get()) == SQLITE_ROW) {
            const auto it = byId.find(column_text(linkStmt.get(), 0));
            if (it != byId.end()) part.clips.push_back(it->second);
        }
        sqlite3_reset(linkStmt.get());

        plan.parts.push_back(std::move(part));
    }
    return plan;
}

}  // namespace reelcut
