#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>

namespace {

struct LogState {
    std::string path = default_log_path();
    LogLevel min_level = LogLevel::Info;
};

LogState& state() {
    static LogState s;
    return s;
}

const char* level_tag(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO ";
    case LogLevel::Warn:  return "WARN ";
    case LogLevel::Error: return "ERROR";
    }
    return "?";
}

} // namespace

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") { out = LogLevel::Debug; return true; }
    if (lower == "info")  { out = LogLevel::Info;  return true; }
    if (lower == "warn" || lower == "warning") { out = LogLevel::Warn; return true; }
    if (lower == "error") { out = LogLevel::Error; return true; }
    return false;
}

void relay_log_configure(const std::string& path, LogLevel min_level) {
    state().path = path;
    state().min_level = min_level;
}

std::string default_log_path() {
    return (platform::temp_dir() / "sshrelay_debug.log").string();
}

void relay_log(LogLevel level, const std::string& msg) {
    const auto& s = state();
    if (s.path.empty() || level < s.min_level) return;

    std::ofstream out(s.path, std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    out << fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {} {}\n",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()), level_tag(level), msg);
}

void relay_log_ssh(const std::string& label, const std::string& cmd, const SSHResult& r) {
    relay_log(LogLevel::Debug, fmt::format("{} CMD: {}", label, cmd));
    relay_log(LogLevel::Debug, fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                                           r.stdout_data.size(), r.stdout_data.substr(0, LOG_OUTPUT_PREVIEW_CHARS)));
    if (!r.stderr_data.empty())
        relay_log(LogLevel::Debug, fmt::format("{} stderr={}", label, r.stderr_data.substr(0, LOG_OUTPUT_PREVIEW_CHARS)));
    if (r.signaled())
        relay_log(LogLevel::Debug, fmt::format("{} signal={}", label, r.exit_signal));
}
