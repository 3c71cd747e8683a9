#pragma once

#include <string>
#include <vector>
#include <filesystem>

// Safe integer parse: returns fallback on failure (no exceptions).
// The whole string must be a number; "22abc" yields the fallback.
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Split on runs of spaces/tabs, dropping empty fields.
std::vector<std::string> split_whitespace(const std::string& s);

// Expand a leading "~" or "~/" to the home directory.
std::filesystem::path expand_home(const std::string& path);

// Quote a string for a POSIX shell: abc'd → 'abc'\''d'
std::string shell_quote(const std::string& s);

// Directory part of a remote POSIX path ("/a/b/c" → "/a/b", "c" → ".").
std::string remote_dirname(const std::string& path);

// Standard base64 with padding.
std::string base64_encode(const std::string& input);
