#include "public_key.hpp"
#include "utils.hpp"
#include <fstream>
#include <set>

static const std::set<std::string> KEY_TYPES{
    "ssh-rsa",
    "ssh-dss",
    "ssh-ed25519",
    "ecdsa-sha2-nistp256",
    "ecdsa-sha2-nistp384",
    "ecdsa-sha2-nistp521",
    "sk-ssh-ed25519@openssh.com",
    "sk-ecdsa-sha2-nistp256@openssh.com",
};

static bool is_base64(const std::string& s) {
    if (s.empty()) return false;
    size_t padding = 0;
    for (char c : s) {
        bool alpha = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                     (c >= '0' && c <= '9') || c == '+' || c == '/';
        if (c == '=') {
            padding++;
        } else if (!alpha || padding > 0) {
            return false;   // data after padding
        }
    }
    return padding <= 2 && s.size() % 4 == 0;
}

Result<PublicKey> PublicKey::parse(const std::string& line) {
    std::string text = line;
    trim(text);
    if (text.empty()) {
        return Result<PublicKey>::Err("Public key is empty");
    }
    if (text.find_first_of("\r\n") != std::string::npos) {
        return Result<PublicKey>::Err("Public key must be a single line");
    }

    auto fields = split_whitespace(text);
    if (fields.size() < 2) {
        return Result<PublicKey>::Err("Public key must be '<type> <base64> [comment]'");
    }

    PublicKey key;
    key.type = fields[0];
    key.blob = fields[1];
    for (size_t i = 2; i < fields.size(); i++) {
        if (!key.comment.empty()) key.comment += " ";
        key.comment += fields[i];
    }

    if (KEY_TYPES.count(key.type) == 0) {
        return Result<PublicKey>::Err("Unsupported key type '" + key.type + "'");
    }
    if (!is_base64(key.blob)) {
        return Result<PublicKey>::Err("Key data is not valid base64");
    }
    return Result<PublicKey>::Ok(key);
}

Result<PublicKey> PublicKey::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<PublicKey>::Err("Cannot read public key file " + path.string());
    }

    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto key = parse(line);
        if (key.is_err()) {
            return Result<PublicKey>::Err(path.string() + ": " + key.error);
        }
        return key;
    }
    return Result<PublicKey>::Err("No public key found in " + path.string());
}
