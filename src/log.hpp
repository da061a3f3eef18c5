#pragma once

#include <string>

namespace pseudo_mt {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

void set_log_level(LogLevel level);
LogLevel log_level();

// Writes one "[tag] message" line to stderr. Safe to call from any thread.
void log_line(LogLevel level, const std::string& message);

inline void log_debug(const std::string& message) { log_line(LogLevel::Debug, message); }
inline void log_info(const std::string& message) { log_line(LogLevel::Info, message); }
inline void log_warning(const std::string& message) { log_line(LogLevel::Warning, message); }
inline void log_error(const std::string& message) { log_line(LogLevel::Error, message); }

}  // namespace pseudo_mt
