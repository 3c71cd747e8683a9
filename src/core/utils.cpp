#include "utils.hpp"
#include <stdexcept>
#include <platform/platform.hpp>

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t consumed = 0;
        int v = std::stoi(s, &consumed);
        return consumed == s.size() ? v : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos < s.size()) {
        auto start = s.find_first_not_of(" \t", pos);
        if (start == std::string::npos) break;
        auto end = s.find_first_of(" \t", start);
        if (end == std::string::npos) end = s.size();
        out.push_back(s.substr(start, end - start));
        pos = end;
    }
    return out;
}

std::filesystem::path expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir();
    if (path.rfind("~/", 0) == 0) {
        return platform::home_dir() / path.substr(2);
    }
    return std::filesystem::path(path);
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string remote_dirname(const std::string& path) {
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return path.substr(0, slash);
}

static const char B64_CHARS[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const std::string& input) {
    std::string out;
    out.reserve(((input.size() + 2) / 3) * 4);
    const auto* data = reinterpret_cast<const unsigned char*>(input.data());
    size_t len = input.size();
    for (size_t i = 0; i < len; i += 3) {
        unsigned val = data[i] << 16;
        if (i + 1 < len) val |= data[i + 1] << 8;
        if (i + 2 < len) val |= data[i + 2];
        out += B64_CHARS[(val >> 18) & 0x3F];
        out += B64_CHARS[(val >> 12) & 0x3F];
        out += (i + 1 < len) ? B64_CHARS[(val >> 6) & 0x3F] : '=';
        out += (i + 2 < len) ? B64_CHARS[val & 0x3F] : '=';
    }
    return out;
}
