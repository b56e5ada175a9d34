#ifndef __LOCUS_LOG_HPP__
#define __LOCUS_LOG_HPP__

#include <iostream>
#include <string>

// ============================================================================
// Log Level Control System
// ============================================================================
// Define log levels (higher number = more verbose)
#define LOG_LEVEL_SILENT  0  // No logs
#define LOG_LEVEL_ERROR   1  // Errors only
#define LOG_LEVEL_WARN    2  // Warnings + errors
#define LOG_LEVEL_INFO    3  // Info + warnings + errors (default)
#define LOG_LEVEL_VERBOSE 4  // Resolution decisions, requests, fallbacks

// Compile-time ceiling: messages above it are compiled out
#ifndef LOG_LEVEL
#define LOG_LEVEL LOG_LEVEL_VERBOSE
#endif

namespace locus {

// Runtime threshold, below the compile-time ceiling (default: LOG_LEVEL_INFO)
// Set from the "log_level" key of the loader config
int log_level();
void set_log_level(int level);

// "silent", "error", "warn", "info", "verbose" -> level; returns -1 if unknown
int parse_log_level(const std::string& name);
const char* log_level_name(int level);

} // namespace locus

// Logging macros - filtered by both the compile-time and runtime level
#define LOCUS_LOG_ENABLED(level) (LOG_LEVEL >= (level) && ::locus::log_level() >= (level))

#define LOG_VERBOSE(msg) do { if(LOCUS_LOG_ENABLED(LOG_LEVEL_VERBOSE)) { std::cout << "[locus] " << msg << std::endl; } } while(0)
#define LOG_INFO(msg)    do { if(LOCUS_LOG_ENABLED(LOG_LEVEL_INFO))    { std::cout << "[locus] " << msg << std::endl; } } while(0)
#define LOG_WARN(msg)    do { if(LOCUS_LOG_ENABLED(LOG_LEVEL_WARN))    { std::cerr << "[locus] " << msg << std::endl; } } while(0)
#define LOG_ERROR(msg)   do { if(LOCUS_LOG_ENABLED(LOG_LEVEL_ERROR))   { std::cerr << "[locus][ERROR] " << msg << std::endl; } } while(0)

// Print current runtime log level (call once at startup)
#define LOG_PRINT_LEVEL() do { std::cout << "[Log] Level: " << ::locus::log_level_name(::locus::log_level()) << " (" << ::locus::log_level() << ")" << std::endl; } while(0)

#endif
