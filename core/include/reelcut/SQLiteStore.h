#pragma once

#include "reelcut/ClipTypes.h"

#include <sqlite3.h>

#include <optional>
#include <string>
#include <vector>

namespace reelcut {

struct StoredRun {
    std::string runId;
    std::string mode;
    std::string status;
    double sourceDuration{0.0};
    WeightProfile weights;
    int rejectedSegments{0};
    std::string contractVersion;
};

class SQLiteStore {
  public:
    explicit SQLiteStore(const std::string& path);
    ~SQLiteStore();

    SQLiteStore(const SQLiteStore&) = delete;
    SQLiteStore& operator=(const SQLiteStore&) = delete;

    void initialize();

    // Replaces everything stored under result.runId in one transaction.
    void save_run(const RunResult& result);

    std::optional<StoredRun> load_run(const std::string& runId);
    std::vector<Clip> load_clips(const std::string& runId, const std::string& kind = "main");
    std::optional<SplitPlan> load_split_plan(const std::string& runId);

  private:
    int run_key(const std::string& runId);

    sqlite3* db_{nullptr};
};

}  // namespace reelcut
