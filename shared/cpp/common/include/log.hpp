#pragma once
#include <string>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// "debug" | "info" | "warn" | "error"; anything else maps to Info.
LogLevel parse_log_level(const std::string& s);
void set_log_level(LogLevel level);
LogLevel log_level();

// Writes "[component] message" as one line. Warn and Error go to stderr.
void log_line(LogLevel level, const std::string& component, const std::string& message);

inline void log_debug(const std::string& c, const std::string& m) { log_line(LogLevel::Debug, c, m); }
inline void log_info(const std::string& c, const std::string& m) { log_line(LogLevel::Info, c, m); }
inline void log_warn(const std::string& c, const std::string& m) { log_line(LogLevel::Warn, c, m); }
inline void log_error(const std::string& c, const std::string& m) { log_line(LogLevel::Error, c, m); }
