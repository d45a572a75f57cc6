#pragma once
#include <string>

enum class LogLevel { debug = 0, info = 1, warn = 2, error = 3 };

void set_log_level(LogLevel level);
LogLevel parse_log_level(const std::string& s);

// Writes "[tag] msg" (or "[WARN][tag] msg") as one line on stderr.
void log_line(LogLevel level, const std::string& tag, const std::string& msg);

inline void log_debug(const std::string& tag, const std::string& msg) { log_line(LogLevel::debug, tag, msg); }
inline void log_info(const std::string& tag, const std::string& msg) { log_line(LogLevel::info, tag, msg); }
inline void log_warn(const std::string& tag, const std::string& msg) { log_line(LogLevel::warn, tag, msg); }
inline void log_error(const std::string& tag, const std::string& msg) { log_line(LogLevel::error, tag, msg); }
