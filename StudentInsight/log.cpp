#include "log.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>

namespace {

std::atomic<int> g_level{ static_cast<int>(LogLevel::Info) };
std::mutex g_log_mtx;

const char* level_tag(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:   return "DEBUG";
    case LogLevel::Warning: return "WARN";
    case LogLevel::Error:   return "ERROR";
    default:                return "INFO";
    }
}

} // namespace

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

bool parse_log_level(const std::string& text, LogLevel& out) {
    if (text == "debug") { out = LogLevel::Debug; return true; }
    if (text == "info") { out = LogLevel::Info; return true; }
    if (text == "warning" || text == "warn") { out = LogLevel::Warning; return true; }
    if (text == "error") { out = LogLevel::Error; return true; }
    return false;
}

void log_message(LogLevel level, const std::string& msg) {
    if (static_cast<int>(level) < g_level.load()) return;

    const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
    char timebuf[32] = { 0 };
    if (localtime_r(&t, &tm_buf) == nullptr ||
        std::strftime(timebuf, sizeof(timebuf), "%Y-%m-%d %H:%M:%S", &tm_buf) == 0) {
        timebuf[0] = '\0';
    }

    std::lock_guard<std::mutex> lg(g_log_mtx);
    if (timebuf[0] != '\0') std::cerr << timebuf << ' ';
    std::cerr << '[' << level_tag(level) << "] " << msg << '\n';
}
