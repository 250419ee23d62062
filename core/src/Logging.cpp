#include "reelcut/Logging.h"

#include <atomic>
#include <stdexcept>

namespace reelcut {

namespace {

std::atomic<int> g_log_verbosity{static_cast<int>(LogVerbosity::Warn)};

}  // namespace

void set_log_verbosity(LogVerbosity level) {
    g_log_verbosity.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogVerbosity get_log_verbosity() {
    return static_cast<LogVerbosity>(g_log_verbosity.load(std::memory_order_relaxed));
}

LogVerbosity log_verbosity_from_string(const std::string& value) {
    if (value == "error") {
        return LogVerbosity::Error;
    }
    if (value == "warn") {
        return LogVerbosity::Warn;
    }
    if (value == "info") {
        return LogVerbosity::Info;
    }
    if (value == "debug") {
        return LogVerbosity::Debug;
    }
    throw std::runtime_error("Unknown log verbosity: " + value);
}

}  // namespace reelcut
