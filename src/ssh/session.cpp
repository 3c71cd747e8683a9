#include "session.hpp"
#include "host_key.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <cstdlib>
#include <cstring>

// libssh2_init once per process, libssh2_exit at shutdown.
namespace {
struct LibSSH2Runtime {
    int rc;
    LibSSH2Runtime() : rc(libssh2_init(0)) {}
    ~LibSSH2Runtime() { if (rc == 0) libssh2_exit(); }
};

int libssh2_runtime_status() {
    static LibSSH2Runtime runtime;
    return runtime.rc;
}
} // namespace

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// libssh2 keyboard-interactive callback: answer every prompt with the password.
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        // libssh2 releases each response with free()
        responses[i].text = static_cast<char*>(std::malloc(data->password.size() + 1));
        if (!responses[i].text) {
            responses[i].length = 0;
            continue;
        }
        std::memcpy(responses[i].text, data->password.c_str(), data->password.size() + 1);
        responses[i].length = static_cast<unsigned int>(data->password.size());
    }
    data->prompt_round++;
}

// ── ConnectionRequest ────────────────────────────────────────────────

Result<void> ConnectionRequest::validate() const {
    if (host.empty()) return Result<void>::Err("host must not be empty");
    if (user.empty()) return Result<void>::Err("user must not be empty");
    if (timeout <= 0) return Result<void>::Err("timeout must be positive");
    if (port < 1 || port > 65535) {
        return Result<void>::Err(fmt::format("port {} out of range", port));
    }
    return Result<void>::Ok();
}

// ── helpers ──────────────────────────────────────────────────────────

static int remaining_ms(Deadline deadline) {
    if (deadline == no_deadline()) return -1;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

bool wait_for_session(LIBSSH2_SESSION* session, socket_t sock, Deadline deadline) {
    int timeout_ms = remaining_ms(deadline);
    if (timeout_ms == 0) return false;

    short events = 0;
    int dir = libssh2_session_block_directions(session);
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;

    int revents = platform::poll_socket(sock, events, timeout_ms);
    if (revents == 0) {
        // Timed out, unless there is still time left (spurious wakeup)
        return remaining_ms(deadline) != 0;
    }
    return true;
}

std::string libssh2_error_text(LIBSSH2_SESSION* session) {
    if (!session) return "";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<size_t>(len)) : "";
}

SSHError classify_libssh2_error(LIBSSH2_SESSION* session, int rc, const std::string& context) {
    std::string detail = libssh2_error_text(session);
    std::string message = detail.empty() ? fmt::format("{} (rc={})", context, rc)
                                         : fmt::format("{}: {}", context, detail);
    switch (rc) {
    case LIBSSH2_ERROR_AUTHENTICATION_FAILED:
    case LIBSSH2_ERROR_PASSWORD_EXPIRED:
    case LIBSSH2_ERROR_PUBLICKEY_UNVERIFIED:
        return SSHError{SSHErrorKind::AUTH, message};
    case LIBSSH2_ERROR_TIMEOUT:
    case LIBSSH2_ERROR_SOCKET_TIMEOUT:
        return SSHError{SSHErrorKind::CONNECTION, message};
    default:
        return SSHError{SSHErrorKind::PROTOCOL, message};
    }
}

SSHOutcome<AuthMethods> password_auth_methods(const std::string& offered) {
    AuthMethods methods;
    size_t start = 0;
    while (start <= offered.size()) {
        size_t comma = offered.find(',', start);
        if (comma == std::string::npos) comma = offered.size();
        std::string name = offered.substr(start, comma - start);
        trim(name);
        if (name == "password") methods.password = true;
        if (name == "keyboard-interactive") methods.keyboard_interactive = true;
        start = comma + 1;
    }
    if (!methods.password && !methods.keyboard_interactive) {
        return SSHOutcome<AuthMethods>::Err(SSHErrorKind::AUTH,
            "Server does not accept password authentication (offers: " + offered + ")");
    }
    return SSHOutcome<AuthMethods>::Ok(methods);
}

// ── SessionManager ───────────────────────────────────────────────────

SessionManager::SessionManager(const ConnectionRequest& request)
    : request_(request), session_(nullptr), sock_(SSHRELAY_INVALID_SOCKET), active_(false) {
}

SessionManager::~SessionManager() {
    close();
}

SSHOutcome<void> SessionManager::establish(StatusCallback callback) {
    auto valid = request_.validate();
    if (valid.is_err()) {
        return SSHOutcome<void>::Err(SSHErrorKind::CONNECTION, valid.error);
    }

    if (libssh2_runtime_status() != 0) {
        return SSHOutcome<void>::Err(SSHErrorKind::PROTOCOL, "Failed to initialize libssh2");
    }

    Deadline deadline = std::chrono::steady_clock::now() + std::chrono::seconds(request_.timeout);
    target_str_ = request_.user + "@" + HostKeyVerifier::known_hosts_name(request_.host, request_.port);

    if (callback) callback("Connecting to " + request_.host + "...");
    relay_log(fmt::format("connecting to {} (timeout {}s)", target_str_, request_.timeout));

    auto sock = platform::connect_tcp(request_.host, request_.port, deadline);
    if (sock.is_err()) {
        relay_log(LogLevel::Error, sock.error);
        return SSHOutcome<void>::Err(SSHErrorKind::CONNECTION, sock.error);
    }
    sock_ = sock.value;

    if (callback) callback("TCP connected, starting SSH handshake...");

    auto hs = handshake(deadline, callback);
    if (hs.is_err()) {
        relay_log(LogLevel::Error, fmt::format("handshake with {} failed: {}", target_str_, hs.error.message));
        close();
        return hs;
    }

    HostKeyVerifier verifier(request_.host_key_policy, request_.known_hosts_path);
    auto hk = verifier.verify(session_, request_.host, request_.port, callback);
    if (hk.is_err()) {
        relay_log(LogLevel::Error, hk.error.message);
        close();
        return hk;
    }

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth = ssh_userauth(deadline, callback);
    if (auth.is_err()) {
        relay_log(LogLevel::Error, fmt::format("authentication as {} failed: {}", target_str_, auth.error.message));
        close();
        return auth;
    }

    active_ = true;
    relay_log("connected to " + target_str_);
    if (callback) callback("Connected to " + request_.host);
    return SSHOutcome<void>::Ok();
}

SSHOutcome<void> SessionManager::handshake(Deadline deadline, StatusCallback /*callback*/) {
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        return SSHOutcome<void>::Err(SSHErrorKind::PROTOCOL, "Failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 0);

    int rc;
    while ((rc = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_for_session(session_, sock_, deadline)) {
            return SSHOutcome<void>::Err(SSHErrorKind::CONNECTION,
                fmt::format("Timed out after {}s waiting for SSH handshake with {}",
                            request_.timeout, request_.host));
        }
    }
    if (rc != 0) {
        return SSHOutcome<void>::Err(classify_libssh2_error(session_, rc, "SSH handshake failed"));
    }
    return SSHOutcome<void>::Ok();
}

SSHOutcome<void> SessionManager::ssh_userauth(Deadline deadline, StatusCallback callback) {
    const std::string& user = request_.user;
    auto timed_out = [&]() {
        return SSHOutcome<void>::Err(SSHErrorKind::CONNECTION,
            fmt::format("Timed out after {}s during authentication", request_.timeout));
    };

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, user.c_str(),
                                              static_cast<unsigned int>(user.length()))) == nullptr) {
        int err = libssh2_session_last_errno(session_);
        if (err != LIBSSH2_ERROR_EAGAIN) break;
        if (!wait_for_session(session_, sock_, deadline)) return timed_out();
    }

    if (!auth_list) {
        // "none" authentication was accepted
        if (libssh2_userauth_authenticated(session_)) {
            return SSHOutcome<void>::Ok();
        }
        return SSHOutcome<void>::Err(classify_libssh2_error(
            session_, libssh2_session_last_errno(session_), "Failed to query auth methods"));
    }

    std::string methods = auth_list;
    relay_log(LogLevel::Debug, "auth methods: " + methods);
    if (callback) callback("Auth methods: " + methods);

    auto offered = password_auth_methods(methods);
    if (offered.is_err()) return SSHOutcome<void>::Err(offered.error);
    bool offers_password = offered.value.password;
    bool offers_kbdint = offered.value.keyboard_interactive;

    int rc = LIBSSH2_ERROR_AUTHENTICATION_FAILED;

    if (offers_password) {
        if (callback) callback("Using password auth...");
        while ((rc = libssh2_userauth_password(session_, user.c_str(),
                                               request_.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            if (!wait_for_session(session_, sock_, deadline)) return timed_out();
        }
        if (rc == 0) {
            if (callback) callback("Authentication successful");
            return SSHOutcome<void>::Ok();
        }
        if (rc != LIBSSH2_ERROR_AUTHENTICATION_FAILED || !offers_kbdint) {
            return SSHOutcome<void>::Err(classify_libssh2_error(session_, rc, "Password authentication failed"));
        }
        if (callback) callback("Password auth rejected, trying keyboard-interactive...");
    }

    if (offers_kbdint) {
        if (callback) callback("Using keyboard-interactive auth...");

        KbdAuthData kbd_data;
        kbd_data.password = request_.password;
        kbd_data.prompt_round = 0;
        *libssh2_session_abstract(session_) = &kbd_data;

        while ((rc = libssh2_userauth_keyboard_interactive(session_, user.c_str(),
                                                           kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            if (!wait_for_session(session_, sock_, deadline)) {
                *libssh2_session_abstract(session_) = nullptr;
                return timed_out();
            }
        }
        *libssh2_session_abstract(session_) = nullptr;

        if (rc == 0) {
            if (callback) callback("Authentication successful");
            return SSHOutcome<void>::Ok();
        }
        return SSHOutcome<void>::Err(classify_libssh2_error(session_, rc,
                                                            "Keyboard-interactive authentication failed"));
    }

    return SSHOutcome<void>::Err(classify_libssh2_error(session_, rc, "Authentication failed"));
}

void SessionManager::close() {
    active_ = false;

    if (session_) {
        // Bounded, blocking goodbye so a dead peer cannot hang teardown
        libssh2_session_set_timeout(session_, 2000);
        libssh2_session_set_blocking(session_, 1);
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }

    if (sock_ != SSHRELAY_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = SSHRELAY_INVALID_SOCKET;
    }
}

bool SessionManager::is_active() const {
    return active_;
}
