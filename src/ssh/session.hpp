#pragma once

#include <chrono>
#include <string>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "result.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

using Deadline = std::chrono::steady_clock::time_point;

// No deadline: wait as long as it takes.
inline Deadline no_deadline() { return Deadline::max(); }

// Everything needed to open one authenticated session.
struct ConnectionRequest {
    std::string host;
    int port = SSH_DEFAULT_PORT;
    std::string user;
    std::string password;
    int timeout = SSH_CONNECT_TIMEOUT_SECS;   // seconds
    HostKeyPolicy host_key_policy = HostKeyPolicy::ACCEPT_ANY;
    std::string known_hosts_path;             // empty → ~/.ssh/known_hosts

    // host/user non-empty, timeout positive, port in range.
    Result<void> validate() const;
};

// Owns the socket and libssh2 session for one connection. Closing is
// unconditional: the destructor tears down whatever was set up.
class SessionManager {
public:
    explicit SessionManager(const ConnectionRequest& request);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Connect, handshake, verify the host key and authenticate, all within
    // request.timeout seconds.
    SSHOutcome<void> establish(StatusCallback callback = nullptr);
    void close();
    bool is_active() const;

    LIBSSH2_SESSION* get_raw_session() { return session_; }
    socket_t get_socket() const { return sock_; }
    const std::string& get_target() const { return target_str_; }

private:
    ConnectionRequest request_;
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    bool active_;
    std::string target_str_;

    SSHOutcome<void> handshake(Deadline deadline, StatusCallback callback);
    SSHOutcome<void> ssh_userauth(Deadline deadline, StatusCallback callback);
};

// Block until the socket is ready in whichever direction libssh2 last
// reported as blocked. Returns false if the deadline passed first.
bool wait_for_session(LIBSSH2_SESSION* session, socket_t sock, Deadline deadline);

// libssh2's last error message for this session ("" if none).
std::string libssh2_error_text(LIBSSH2_SESSION* session);

// Password-style methods a server offers in its comma-separated auth list.
struct AuthMethods {
    bool password = false;
    bool keyboard_interactive = false;
};

// AUTH error when the list has neither password nor keyboard-interactive.
SSHOutcome<AuthMethods> password_auth_methods(const std::string& offered);

// Map a libssh2 return code onto the error taxonomy.
SSHError classify_libssh2_error(LIBSSH2_SESSION* session, int rc, const std::string& context);
