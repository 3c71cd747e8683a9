#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

// One OpenSSH public key line: "<type> <base64> [comment]".
struct PublicKey {
    std::string type;
    std::string blob;       // base64 key data
    std::string comment;

    static Result<PublicKey> parse(const std::string& line);

    // First non-empty, non-comment line of the file.
    static Result<PublicKey> load(const std::filesystem::path& path);

    // "<type> <blob>": what identifies the key regardless of comment.
    std::string identity() const { return type + " " + blob; }

    // Full authorized_keys line (no trailing newline).
    std::string line() const {
        return comment.empty() ? identity() : identity() + " " + comment;
    }
};
