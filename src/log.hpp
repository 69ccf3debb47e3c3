#pragma once
#include <string>

namespace toolhost {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Process-wide threshold. Lines below it are dropped.
void set_log_level(LogLevel level);
LogLevel log_level();

// Parse "debug" / "info" / "warn" / "error" (case-insensitive).
// Returns false and leaves `out` untouched for anything else.
bool parse_log_level(const std::string& name, LogLevel& out);

// Writes "[tag] message" to stderr as one line when `level` passes the
// threshold. Safe to call from any thread.
void log_line(LogLevel level, const std::string& tag, const std::string& message);

inline void log_debug(const std::string& tag, const std::string& message) {
    log_line(LogLevel::Debug, tag, message);
}
inline void log_info(const std::string& tag, const std::string& message) {
    log_line(LogLevel::Info, tag, message);
}
inline void log_warn(const std::string& tag, const std::string& message) {
    log_line(LogLevel::Warn, tag, message);
}
inline void log_error(const std::string& tag, const std::string& message) {
    log_line(LogLevel::Error, tag, message);
}

} // namespace toolhost
