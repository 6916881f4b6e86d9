#include "../include/log.hpp"
#include "../include/util.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace {
std::atomic<int> g_level{static_cast<int>(parse_log_level(getenv_or("FLEET_LOG_LEVEL", "info")))};
std::mutex g_out_mtx;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG ";
        case LogLevel::Warn: return "WARN ";
        case LogLevel::Error: return "ERROR ";
        default: return "";
    }
}
}

LogLevel parse_log_level(const std::string& s) {
    auto l = to_lower(s);
    if (l == "debug") return LogLevel::Debug;
    if (l == "warn" || l == "warning") return LogLevel::Warn;
    if (l == "error") return LogLevel::Error;
    return LogLevel::Info;
}

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

void log_line(LogLevel level, const std::string& component, const std::string& message) {
    if (static_cast<int>(level) < g_level.load()) return;
    std::lock_guard<std::mutex> lock(g_out_mtx);
    std::ostream& os = (level >= LogLevel::Warn) ? std::cerr : std::cout;
    os << "[" << component << "] " << level_tag(level) << message << std::endl;
}
