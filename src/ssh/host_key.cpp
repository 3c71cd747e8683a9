#include "host_key.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <memory>

namespace fs = std::filesystem;

HostKeyDecision decide_host_key(HostKeyPolicy policy, HostKeyMatch match) {
    switch (policy) {
    case HostKeyPolicy::STRICT:
        return {match == HostKeyMatch::MATCH, false};
    case HostKeyPolicy::ACCEPT_NEW:
        if (match == HostKeyMatch::MISMATCH) return {false, false};
        return {true, match == HostKeyMatch::NOT_FOUND};
    case HostKeyPolicy::ACCEPT_ANY:
        return {true, false};
    }
    return {false, false};
}

// Host key type (from libssh2_session_hostkey) → knownhost type bits.
static int knownhost_key_bits(int hostkey_type) {
    switch (hostkey_type) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:       return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:       return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
    case LIBSSH2_HOSTKEY_TYPE_ED25519:   return LIBSSH2_KNOWNHOST_KEY_ED25519;
    default:                             return -1;
    }
}

HostKeyVerifier::HostKeyVerifier(HostKeyPolicy policy, std::string known_hosts_path)
    : policy_(policy), known_hosts_path_(std::move(known_hosts_path)) {
}

std::string HostKeyVerifier::known_hosts_name(const std::string& host, int port) {
    if (port == 22) return host;
    return fmt::format("[{}]:{}", host, port);
}

std::string HostKeyVerifier::fingerprint(LIBSSH2_SESSION* session) {
    const char* hash = libssh2_hostkey_hash(session, LIBSSH2_HOSTKEY_HASH_SHA256);
    if (!hash) return "";
    std::string b64 = base64_encode(std::string(hash, 32));
    while (!b64.empty() && b64.back() == '=') b64.pop_back();
    return "SHA256:" + b64;
}

Result<void> HostKeyVerifier::append_known_host(const fs::path& path, const std::string& entry) {
    std::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);

    // Don't glue the entry onto a last line that lacks its newline
    bool needs_newline = false;
    {
        std::ifstream in(path, std::ios::binary | std::ios::ate);
        if (in && in.tellg() > 0) {
            in.seekg(-1, std::ios::end);
            char last = '\n';
            in.get(last);
            needs_newline = last != '\n';
        }
    }

    std::ofstream out(path, std::ios::app | std::ios::binary);
    if (!out) return Result<void>::Err("could not write " + path.string());
    if (needs_newline) out << '\n';
    out << entry;
    if (entry.empty() || entry.back() != '\n') out << '\n';
    if (!out) return Result<void>::Err("could not write " + path.string());
    return Result<void>::Ok();
}

SSHOutcome<void> HostKeyVerifier::verify(LIBSSH2_SESSION* session, const std::string& host,
                                         int port, StatusCallback callback) {
    std::string fp = fingerprint(session);
    relay_log(fmt::format("host key for {} is {} (policy {})",
                          known_hosts_name(host, port), fp, to_string(policy_)));

    if (policy_ == HostKeyPolicy::ACCEPT_ANY) {
        if (callback) callback("Host key not verified (accept-any): " + fp);
        return SSHOutcome<void>::Ok();
    }

    size_t key_len = 0;
    int key_type = 0;
    const char* key = libssh2_session_hostkey(session, &key_len, &key_type);
    if (!key) {
        return SSHOutcome<void>::Err(SSHErrorKind::PROTOCOL, "Server did not provide a host key");
    }
    int key_bits = knownhost_key_bits(key_type);
    if (key_bits < 0) {
        return SSHOutcome<void>::Err(SSHErrorKind::PROTOCOL,
            fmt::format("Unsupported host key type {} from {}", key_type, host));
    }

    std::unique_ptr<LIBSSH2_KNOWNHOSTS, decltype(&libssh2_knownhost_free)> hosts(
        libssh2_knownhost_init(session), &libssh2_knownhost_free);
    if (!hosts) {
        return SSHOutcome<void>::Err(SSHErrorKind::PROTOCOL, "Failed to initialize known hosts");
    }

    fs::path path = expand_home(known_hosts_path_.empty() ? std::string(DEFAULT_KNOWN_HOSTS_FILE)
                                                         : known_hosts_path_);
    std::error_code ec;
    if (fs::exists(path, ec)) {
        int n = libssh2_knownhost_readfile(hosts.get(), path.string().c_str(),
                                           LIBSSH2_KNOWNHOST_FILE_OPENSSH);
        if (n < 0) {
            if (policy_ == HostKeyPolicy::STRICT) {
                return SSHOutcome<void>::Err(SSHErrorKind::PROTOCOL,
                    "Cannot read known hosts file " + path.string());
            }
            relay_log(LogLevel::Warn, fmt::format("known_hosts {} unreadable (rc={})", path.string(), n));
        }
    }

    const int typemask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | key_bits;
    struct libssh2_knownhost* found = nullptr;
    int check = libssh2_knownhost_checkp(hosts.get(), host.c_str(), port,
                                         key, key_len, typemask, &found);

    HostKeyMatch match;
    switch (check) {
    case LIBSSH2_KNOWNHOST_CHECK_MATCH:    match = HostKeyMatch::MATCH; break;
    case LIBSSH2_KNOWNHOST_CHECK_MISMATCH: match = HostKeyMatch::MISMATCH; break;
    case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND: match = HostKeyMatch::NOT_FOUND; break;
    default:
        return SSHOutcome<void>::Err(SSHErrorKind::PROTOCOL, "Host key check failed");
    }

    auto decision = decide_host_key(policy_, match);
    if (!decision.accept) {
        if (match == HostKeyMatch::MISMATCH) {
            return SSHOutcome<void>::Err(SSHErrorKind::PROTOCOL, fmt::format(
                "Host key for {} does not match {} (got {})",
                known_hosts_name(host, port), path.string(), fp));
        }
        return SSHOutcome<void>::Err(SSHErrorKind::PROTOCOL, fmt::format(
            "Host key for {} is not in {} (got {})",
            known_hosts_name(host, port), path.string(), fp));
    }

    if (!decision.record) {
        if (callback) callback("Host key verified");
        return SSHOutcome<void>::Ok();
    }

    // accept-new: append just the new entry, leave the rest of the file alone
    std::string name = known_hosts_name(host, port);
    struct libssh2_knownhost* added = nullptr;
    int rc = libssh2_knownhost_addc(hosts.get(), name.c_str(), nullptr, key, key_len,
                                    nullptr, 0, typemask, &added);
    if (rc != 0 || !added) {
        relay_log(LogLevel::Warn, "could not add host key entry for " + name);
        return SSHOutcome<void>::Ok();
    }

    char line[8192];
    size_t line_len = 0;
    rc = libssh2_knownhost_writeline(hosts.get(), added, line, sizeof(line), &line_len,
                                     LIBSSH2_KNOWNHOST_FILE_OPENSSH);
    if (rc != 0) {
        relay_log(LogLevel::Warn, "could not format host key entry for " + name);
        return SSHOutcome<void>::Ok();
    }

    auto written = append_known_host(path, std::string(line, line_len));
    if (written.is_err()) {
        relay_log(LogLevel::Warn, written.error);
        return SSHOutcome<void>::Ok();
    }

    if (callback) callback(fmt::format("Added {} to {}", name, path.string()));
    relay_log(fmt::format("recorded host key for {} in {}", name, path.string()));
    return SSHOutcome<void>::Ok();
}
