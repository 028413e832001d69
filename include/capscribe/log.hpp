#pragma once

#include <string>

namespace capscribe {

// ─── Logging ────────────────────────────────────────────────────────────────
// Diagnostics go to stderr; program output stays on stdout.

enum class LogLevel { Debug = 0, Info = 1, Warning = 2, Error = 3 };

void set_log_level(LogLevel level);
LogLevel log_level();

// Format: "YYYY-MM-DD HH:MM:SS - LEVEL - message"
void log(LogLevel level, const std::string &msg);

inline void log_debug(const std::string &msg) { log(LogLevel::Debug, msg); }
inline void log_info(const std::string &msg) { log(LogLevel::Info, msg); }
inline void log_warning(const std::string &msg) {
    log(LogLevel::Warning, msg);
}
inline void log_error(const std::string &msg) { log(LogLevel::Error, msg); }

} // namespace capscribe
