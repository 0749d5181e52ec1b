#pragma once
#include <string>

/*
-------------------------------------------------------------------------------
 log.hpp - Diagnostic logging
-------------------------------------------------------------------------------
One line per message on std::cerr:

    2026-01-31 14:02:11 [INFO] trained models on 42 students

Messages below the current level are dropped. The level is process-wide and
normally set once at startup from InsightConfig::log_level. Writes are
serialized so lines from concurrent requests never interleave.
-------------------------------------------------------------------------------
*/

enum class LogLevel { Debug = 0, Info = 1, Warning = 2, Error = 3 };

void set_log_level(LogLevel level);
LogLevel log_level();

/// Parse "debug", "info", "warning"/"warn", "error". Returns false if unknown.
bool parse_log_level(const std::string& text, LogLevel& out);

void log_message(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { log_message(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg)  { log_message(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg)  { log_message(LogLevel::Warning, msg); }
inline void log_error(const std::string& msg) { log_message(LogLevel::Error, msg); }
