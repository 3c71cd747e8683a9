#pragma once

#include <filesystem>
#include <string>
#include <core/types.hpp>
#include "result.hpp"

// libssh2 forward declaration
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// Outcome of looking a host key up in known_hosts.
enum class HostKeyMatch {
    MATCH,
    MISMATCH,
    NOT_FOUND,
};

// Decide what to do with a lookup result under a policy. Pure so the
// policy table can be tested without a server.
//   STRICT:     only MATCH passes
//   ACCEPT_NEW: MATCH passes, NOT_FOUND passes and is recorded, MISMATCH fails
//   ACCEPT_ANY: everything passes, nothing is recorded
struct HostKeyDecision {
    bool accept;
    bool record;
};
HostKeyDecision decide_host_key(HostKeyPolicy policy, HostKeyMatch match);

// Checks the server's host key against a known_hosts file.
class HostKeyVerifier {
public:
    HostKeyVerifier(HostKeyPolicy policy, std::string known_hosts_path);

    // Call after the handshake. Rejections are PROTOCOL errors.
    SSHOutcome<void> verify(LIBSSH2_SESSION* session, const std::string& host, int port,
                            StatusCallback callback = nullptr);

    // known_hosts host field: "host" on port 22, "[host]:port" otherwise.
    static std::string known_hosts_name(const std::string& host, int port);

    // Append one known_hosts entry, starting a new line if the file does
    // not end with one. The rest of the file is left untouched.
    static Result<void> append_known_host(const std::filesystem::path& path,
                                          const std::string& entry);

    // "SHA256:<base64>" fingerprint of the session's host key, "" if unavailable.
    static std::string fingerprint(LIBSSH2_SESSION* session);

private:
    HostKeyPolicy policy_;
    std::string known_hosts_path_;
};
