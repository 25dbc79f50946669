#pragma once

#include <string>

namespace roofwatch {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

void set_log_level(LogLevel level);

// Mirrors every diagnostic line to `path` (append). Empty path disables it.
// Returns false if the file cannot be opened.
bool set_log_file(const std::string& path);

void log_message(LogLevel level, const std::string& message);

inline void log_debug(const std::string& message) { log_message(LogLevel::DEBUG, message); }
inline void log_info(const std::string& message) { log_message(LogLevel::INFO, message); }
inline void log_warn(const std::string& message) { log_message(LogLevel::WARN, message); }
inline void log_error(const std::string& message) { log_message(LogLevel::ERROR, message); }

}  // namespace roofwatch
