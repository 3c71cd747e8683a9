#pragma once

#include <string>
#include <ssh/result.hpp>

// CamelCase values: DEBUG and ERROR collide with common macros.
enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Parse "debug" / "info" / "warn" / "error" (case-insensitive).
bool parse_log_level(const std::string& name, LogLevel& out);

// Point the debug log at a file. An empty path disables logging.
void relay_log_configure(const std::string& path, LogLevel min_level);

// Default log location: <tmp>/sshrelay_debug.log
std::string default_log_path();

// Append a timestamped line to the debug log.
void relay_log(LogLevel level, const std::string& msg);

inline void relay_log(const std::string& msg) { relay_log(LogLevel::Info, msg); }

// Log a command and a truncated view of its result.
void relay_log_ssh(const std::string& label, const std::string& cmd, const SSHResult& r);
