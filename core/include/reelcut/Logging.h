#pragma once

#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace reelcut {

/**
 * Logging level policy.
 *
 * - Error: the requested operation cannot complete.
 * - Warn:  a fallback fired, an input was rejected, a collaborator failed.
 * - Info:  one line per pipeline stage.
 * - Debug: per-candidate decisions.
 */
enum class LogVerbosity {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

LogVerbosity log_verbosity_from_string(const std::string& value);

}  // namespace reelcut

inline constexpr reelcut::LogVerbosity reelcut_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return reelcut::LogVerbosity::Error;
    }
    if (tag == "warn") {
        return reelcut::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return reelcut::LogVerbosity::Info;
    }
    return reelcut::LogVerbosity::Debug;
}

inline bool reelcut_should_log(const char* level) {
    const auto severity = reelcut_severity_for_tag(level ? level : "");
    return static_cast<int>(severity) <= static_cast<int>(reelcut::get_log_verbosity());
}

inline void reelcut_log_impl(const char* level, const std::string& message, const char* file, int line) {
    const std::string_view label = level ? level : "";
    if (label == "error") {
        std::cerr << "[ReelCut][" << label << "][" << file << ":" << line << "] " << message << "\n";
        return;
    }
    std::cerr << "[ReelCut][" << label << "] " << message << "\n";
}

#define REELCUT_LOG(level, message)                                                  \
    do {                                                                             \
        if (reelcut_should_log(level)) {                                             \
            std::ostringstream _reelcut_log_stream;                                  \
            _reelcut_log_stream << message;                                          \
            reelcut_log_impl(level, _reelcut_log_stream.str(), __FILE__, __LINE__);  \
        }                                                                            \
    } while (0)

#define REELCUT_LOG_ERROR(message) REELCUT_LOG("error", message)
#define REELCUT_LOG_WARN(message) REELCUT_LOG("warn", message)
#define REELCUT_LOG_INFO(message) REELCUT_LOG("info", message)
#define REELCUT_LOG_DEBUG(message) REELCUT_LOG("debug", message)
