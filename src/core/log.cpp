#include "log.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <mutex>

namespace {

struct LogState {
    std::mutex mutex;
    std::filesystem::path path = platform::temp_dir() / "sshfleet.log";
    LogLevel min_level = LogLevel::INFO;
    bool echo_stderr = false;
};

LogState& state() {
    static LogState s;
    return s;
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return fmt::format("{}.{:03d}", ts, static_cast<int>(ms.count()));
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

void log_configure(const std::filesystem::path& path, LogLevel min_level, bool echo_stderr) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (!path.empty()) {
        s.path = path;
        std::error_code ec;
        if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
    }
    s.min_level = min_level;
    s.echo_stderr = echo_stderr;
}

const std::filesystem::path& fleet_log_path() {
    return state().path;
}

void fleet_log(LogLevel level, const std::string& msg) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (level < s.min_level) return;

    std::string line = fmt::format("[{}] {} {}\n", timestamp(), log_level_name(level), msg);

    std::ofstream out(s.path, std::ios::app);
    if (out) out << line;

    if (s.echo_stderr) {
        std::fputs(line.c_str(), stderr);
    }
}
