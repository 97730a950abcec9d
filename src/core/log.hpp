#pragma once

#include <string>
#include <filesystem>

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
};

// Parse "debug" / "info" / "warn" / "error" (case-insensitive). Unknown → INFO.
LogLevel parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

// Redirect the log. Until this is called lines go to <tmp>/sshfleet.log at INFO.
void log_configure(const std::filesystem::path& path, LogLevel min_level, bool echo_stderr);

const std::filesystem::path& fleet_log_path();

void fleet_log(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { fleet_log(LogLevel::DEBUG, msg); }
inline void log_info(const std::string& msg) { fleet_log(LogLevel::INFO, msg); }
inline void log_warn(const std::string& msg) { fleet_log(LogLevel::WARN, msg); }
inline void log_error(const std::string& msg) { fleet_log(LogLevel::ERROR, msg); }
