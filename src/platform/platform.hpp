#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Put stdout/stderr in binary mode so relayed bytes are not translated.
// No-op on Unix.
void set_binary_stdio();

} // namespace platform
