#include "exec_channel.hpp"
#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <map>

int signal_number(const std::string& name) {
    // RFC 4254 section 6.10 names, numbered as on Linux
    static const std::map<std::string, int> SIGNALS{
        {"HUP", 1},   {"INT", 2},   {"QUIT", 3},  {"ILL", 4},
        {"TRAP", 5},  {"ABRT", 6},  {"BUS", 7},   {"FPE", 8},
        {"KILL", 9},  {"USR1", 10}, {"SEGV", 11}, {"USR2", 12},
        {"PIPE", 13}, {"ALRM", 14}, {"TERM", 15},
    };
    std::string key = name.rfind("SIG", 0) == 0 ? name.substr(3) : name;
    auto it = SIGNALS.find(key);
    return it == SIGNALS.end() ? -1 : it->second;
}

int exit_code_for_signal(const std::string& name) {
    int n = signal_number(name);
    return n < 0 ? EXIT_SIGNAL_BASE : EXIT_SIGNAL_BASE + n;
}

void record_exit(SSHResult& result, int exit_status, const std::string& exit_signal) {
    result.exit_signal = exit_signal;
    result.exit_code = exit_signal.empty() ? exit_status : exit_code_for_signal(exit_signal);
}

ExecChannel::ExecChannel(LIBSSH2_SESSION* session, socket_t sock)
    : session_(session), channel_(nullptr), sock_(sock) {
}

ExecChannel::~ExecChannel() {
    free_channel();
}

void ExecChannel::free_channel() {
    if (!channel_) return;
    int rc;
    while ((rc = libssh2_channel_free(channel_)) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_for_session(session_, sock_, no_deadline())) break;
    }
    channel_ = nullptr;
}

SSHOutcome<void> ExecChannel::open() {
    while ((channel_ = libssh2_channel_open_session(session_)) == nullptr) {
        int err = libssh2_session_last_errno(session_);
        if (err != LIBSSH2_ERROR_EAGAIN) {
            return SSHOutcome<void>::Err(classify_libssh2_error(session_, err, "Failed to open exec channel"));
        }
        wait_for_session(session_, sock_, no_deadline());
    }
    return SSHOutcome<void>::Ok();
}

SSHOutcome<void> ExecChannel::exec(const std::string& command) {
    int rc;
    while ((rc = libssh2_channel_exec(channel_, command.c_str())) == LIBSSH2_ERROR_EAGAIN) {
        wait_for_session(session_, sock_, no_deadline());
    }
    if (rc != 0) {
        return SSHOutcome<void>::Err(classify_libssh2_error(session_, rc, "Failed to exec command"));
    }

    // Nothing is sent on stdin; close it so commands that read it see EOF
    while ((rc = libssh2_channel_send_eof(channel_)) == LIBSSH2_ERROR_EAGAIN) {
        wait_for_session(session_, sock_, no_deadline());
    }
    if (rc != 0) {
        relay_log(LogLevel::Warn, "send_eof failed: " + libssh2_error_text(session_));
    }
    return SSHOutcome<void>::Ok();
}

SSHOutcome<void> ExecChannel::drain(SSHResult& result) {
    char buf[SSH_READ_BUF_SIZE];

    // Both streams are read in the same loop: leaving one unread would let
    // its window fill up and stall the remote command.
    while (true) {
        ssize_t out_n = libssh2_channel_read(channel_, buf, sizeof(buf));
        if (out_n > 0) {
            result.stdout_data.append(buf, static_cast<size_t>(out_n));
        } else if (out_n < 0 && out_n != LIBSSH2_ERROR_EAGAIN) {
            return SSHOutcome<void>::Err(classify_libssh2_error(
                session_, static_cast<int>(out_n), "Error reading remote stdout"));
        }

        ssize_t err_n = libssh2_channel_read_stderr(channel_, buf, sizeof(buf));
        if (err_n > 0) {
            result.stderr_data.append(buf, static_cast<size_t>(err_n));
        } else if (err_n < 0 && err_n != LIBSSH2_ERROR_EAGAIN) {
            return SSHOutcome<void>::Err(classify_libssh2_error(
                session_, static_cast<int>(err_n), "Error reading remote stderr"));
        }

        if (out_n > 0 || err_n > 0) continue;

        // Both reads came back empty; done once the remote sent EOF
        if (out_n == 0 && err_n == 0 && libssh2_channel_eof(channel_)) break;

        wait_for_session(session_, sock_, no_deadline());
    }
    return SSHOutcome<void>::Ok();
}

void ExecChannel::collect_exit(SSHResult& result) {
    int rc;
    while ((rc = libssh2_channel_close(channel_)) == LIBSSH2_ERROR_EAGAIN) {
        wait_for_session(session_, sock_, no_deadline());
    }
    if (rc == 0) {
        while ((rc = libssh2_channel_wait_closed(channel_)) == LIBSSH2_ERROR_EAGAIN) {
            wait_for_session(session_, sock_, no_deadline());
        }
    }
    if (rc != 0) {
        relay_log(LogLevel::Warn, "channel close failed: " + libssh2_error_text(session_));
    }

    int exit_status = libssh2_channel_get_exit_status(channel_);

    char* exit_signal = nullptr;
    size_t exit_signal_len = 0;
    char* error_msg = nullptr;
    size_t error_msg_len = 0;
    char* lang_tag = nullptr;
    size_t lang_tag_len = 0;
    rc = libssh2_channel_get_exit_signal(channel_, &exit_signal, &exit_signal_len,
                                         &error_msg, &error_msg_len,
                                         &lang_tag, &lang_tag_len);
    std::string signal_name;
    if (rc == 0 && exit_signal) signal_name.assign(exit_signal, exit_signal_len);
    record_exit(result, exit_status, signal_name);
    if (exit_signal) libssh2_free(session_, exit_signal);
    if (error_msg) libssh2_free(session_, error_msg);
    if (lang_tag) libssh2_free(session_, lang_tag);
}

SSHOutcome<SSHResult> ExecChannel::run(const std::string& command) {
    if (!session_) {
        return SSHOutcome<SSHResult>::Err(SSHErrorKind::PROTOCOL, "No session available");
    }

    auto opened = open();
    if (opened.is_err()) return SSHOutcome<SSHResult>::Err(opened.error);

    auto started = exec(command);
    if (started.is_err()) return SSHOutcome<SSHResult>::Err(started.error);

    SSHResult result;
    auto drained = drain(result);
    if (drained.is_err()) return SSHOutcome<SSHResult>::Err(drained.error);

    collect_exit(result);
    relay_log_ssh("exec", command, result);
    return SSHOutcome<SSHResult>::Ok(std::move(result));
}
