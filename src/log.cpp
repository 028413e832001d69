#include "capscribe/log.hpp"

#include <chrono>
#include <ctime>
#include <iostream>

namespace capscribe {

namespace {

LogLevel g_level = LogLevel::Info;

const char *level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    }
    return "?";
}

std::string now_string() {
    auto now = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&tt, &tm);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

} // namespace

void set_log_level(LogLevel level) { g_level = level; }

LogLevel log_level() { return g_level; }

void log(LogLevel level, const std::string &msg) {
    if (level < g_level)
        return;
    std::cerr << now_string() << " - " << level_name(level) << " - " << msg
              << std::endl;
}

} // namespace capscribe
