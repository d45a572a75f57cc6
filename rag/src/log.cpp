#include "../include/log.hpp"
#include <atomic>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>

static std::atomic<int> g_level{static_cast<int>(LogLevel::info)};
static std::mutex g_log_mtx;

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel parse_log_level(const std::string& s) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if (v == "debug") return LogLevel::debug;
    if (v == "info") return LogLevel::info;
    if (v == "warn" || v == "warning") return LogLevel::warn;
    if (v == "error") return LogLevel::error;
    return LogLevel::info;
}

void log_line(LogLevel level, const std::string& tag, const std::string& msg) {
    if (static_cast<int>(level) < g_level.load()) return;
    const char* prefix = "";
    switch (level) {
        case LogLevel::debug: prefix = "[DEBUG]"; break;
        case LogLevel::warn: prefix = "[WARN]"; break;
        case LogLevel::error: prefix = "[ERROR]"; break;
        default: break;
    }
    std::lock_guard<std::mutex> lock(g_log_mtx);
    std::cerr << prefix << "[" << tag << "] " << msg << "\n";
}
