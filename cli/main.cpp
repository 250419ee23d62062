#include "reelcut/HighlightEngine.h"
#include "reelcut/JsonIO.h"
#include "reelcut/Logging.h"
#include "reelcut/Utility.h"
#include "reelcut/planning/PartPlanner.h"
#include "reelcut/planning/Schedule.h"
#include "reelcut/scoring/Collaborators.h"

#include <iostream>
#include <memory>
#include <optional>
#include <string>

static void print_usage(const char *prog) {
    std::cerr
        << "Usage: " << prog << " <segments.json> [options]\n"
        << "\nOptions:\n"
        << "  --config PATH           Pipeline configuration (JSON)\n"
        << "  --chat PATH             Chat export; enables the chat burst signal\n"
        << "  --semantic PATH         Precomputed semantic scores {id: score}\n"
        << "  --mode MODE             political | stream (overrides config)\n"
        << "  --prompt TEXT           Boost segments matching this description\n"
        << "  --source-duration SEC   Source length (default: last segment end)\n"
        << "  --base-date YYYY-MM-DD  First day of the publishing schedule\n"
        << "  --db PATH               Store the run in a SQLite database\n"
        << "  --out PATH              Write the result document here\n"
        << "  --run-id ID             Identifier stored with the run\n"
        << "  --log-level LEVEL       error | warn | info | debug (default: warn)\n"
        << "  --verbose               Log stage summaries (twice: per candidate)\n"
        << std::endl;
}

int main(int argc, char *argv[]) {
    using namespace reelcut;

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    try {

        // Parse arguments
        std::string segments_path = argv[1];
        std::string config_path;
        std::string chat_path;
        std::string semantic_path;
        std::string mode_name;
        std::string db_path;
        std::string out_path;
        std::string base_date;
        HighlightRequest request;
        request.runId = "run";
        int verbosity = 0;
        std::string log_level;

        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--verbose") {
                ++verbosity;
            } else if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--chat" && i + 1 < argc) {
                chat_path = argv[++i];
            } else if (arg == "--semantic" && i + 1 < argc) {
                semantic_path = argv[++i];
            } else if (arg == "--mode" && i + 1 < argc) {
                mode_name = argv[++i];
            } else if (arg == "--prompt" && i + 1 < argc) {
                request.prompt = argv[++i];
            } else if (arg == "--source-duration" && i + 1 < argc) {
                request.sourceDuration = std::stod(argv[++i]);
            } else if (arg == "--base-date" && i + 1 < argc) {
                base_date = argv[++i];
            } else if (arg == "--db" && i + 1 < argc) {
                db_path = argv[++i];
            } else if (arg == "--out" && i + 1 < argc) {
                out_path = argv[++i];
            } else if (arg == "--log-level" && i + 1 < argc) {
                log_level = argv[++i];
            } else if (arg == "--run-id" && i + 1 < argc) {
                request.runId = argv[++i];
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }

        if (!log_level.empty()) {
            set_log_verbosity(log_verbosity_from_string(log_level));
        } else if (verbosity == 1) {
            set_log_verbosity(LogVerbosity::Info);
        } else if (verbosity > 1) {
            set_log_verbosity(LogVerbosity::Debug);
        }

        // 1. Configuration
        PipelineConfig config = config_path.empty() ? PipelineConfig{} : io::load_config(config_path);
        if (!mode_name.empty()) {
            config.mode = processing_mode_from_string(mode_name);
        }

        // 2. Inputs
        request.segments = io::load_segments(segments_path);
        if (!chat_path.empty()) {
            request.chat = io::load_chat_histogram(chat_path);
            std::cout << "Chat: " << request.chat.size() << " active seconds" << std::endl;
        }
        if (!base_date.empty()) {
            request.baseDate = planning::parse_date(base_date);
        }

        std::unique_ptr<scoring::SemanticAssessor> assessor;
        if (!semantic_path.empty()) {
            assessor = std::make_unique<scoring::TableSemanticAssessor>(io::load_semantic_table(semantic_path));
        }
        const scoring::LexicalPromptSimilarity prompt_similarity;

        // 3. Run
        HighlightEngine engine(config, assessor.get(), &prompt_similarity, db_path);
        std::cout << "Processing " << request.segments.size() << " segments ("
                  << processing_mode_to_string(config.mode) << " mode)" << std::endl;
        const RunResult result = engine.run(request);

        std::cout << "Status: " << run_status_to_string(result.status) << std::endl;
        if (result.rejectedSegments > 0) {
            std::cout << "  Rejected segments: " << result.rejectedSegments << std::endl;
        }
        for (const auto &note : result.notes) {
            std::cout << "  Note: " << note << std::endl;
        }

        // 4. Report
        std::cout << "\nSelected " << result.clips.size() << " clips ("
                  << format_duration(total_duration(result.clips)) << "):" << std::endl;
        for (const auto &clip : result.clips) {
            std::cout << "  " << clip.clipId << "  [" << format_duration(clip.t0) << " - "
                      << format_duration(clip.t1) << "]  score " << clip.finalScore << "  "
                      << clip.title << std::endl;
        }
        if (!result.shorts.empty()) {
            std::cout << "\nShorts candidates: " << result.shorts.size() << std::endl;
            for (const auto &clip : result.shorts) {
                std::cout << "  " << clip.clipId << "  " << clip.title << std::endl;
            }
        }
        if (result.plan) {
            std::cout << "\n" << planning::format_split_summary(*result.plan) << std::endl;
        }

        if (!out_path.empty()) {
            io::write_result(result, out_path);
            std::cout << "\nResult written to: " << out_path << std::endl;
        }

        return result.status == RunStatus::Completed || result.status == RunStatus::NoCandidates ? 0 : 2;

    } catch (const ConfigError &e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
