#include "locus/log.hpp"
#include <atomic>

namespace locus {

namespace {

std::atomic<int> g_log_level{LOG_LEVEL_INFO};

} // anonymous namespace

int log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

void set_log_level(int level) {
    if (level < LOG_LEVEL_SILENT) {
        level = LOG_LEVEL_SILENT;
    } else if (level > LOG_LEVEL_VERBOSE) {
        level = LOG_LEVEL_VERBOSE;
    }
    g_log_level.store(level, std::memory_order_relaxed);
}

int parse_log_level(const std::string& name) {
    if (name == "silent")  return LOG_LEVEL_SILENT;
    if (name == "error")   return LOG_LEVEL_ERROR;
    if (name == "warn")    return LOG_LEVEL_WARN;
    if (name == "info")    return LOG_LEVEL_INFO;
    if (name == "verbose") return LOG_LEVEL_VERBOSE;
    return -1;
}

const char* log_level_name(int level) {
    switch (level) {
        case LOG_LEVEL_SILENT:  return "SILENT";
        case LOG_LEVEL_ERROR:   return "ERROR";
        case LOG_LEVEL_WARN:    return "WARN";
        case LOG_LEVEL_INFO:    return "INFO";
        case LOG_LEVEL_VERBOSE: return "VERBOSE";
        default:                return "UNKNOWN";
    }
}

} // namespace locus
