#pragma once

#include <string>
#include <platform/socket_util.hpp>
#include "result.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// One exec channel running one command. No PTY, so stdout and stderr
// stay separate and binary-clean.
class ExecChannel {
public:
    ExecChannel(LIBSSH2_SESSION* session, socket_t sock);
    ~ExecChannel();

    ExecChannel(const ExecChannel&) = delete;
    ExecChannel& operator=(const ExecChannel&) = delete;

    // Execute command, send EOF on stdin, read stdout and stderr until the
    // remote side closes them, then collect exit status / exit signal.
    // Blocks until the command finishes.
    SSHOutcome<SSHResult> run(const std::string& command);

private:
    LIBSSH2_SESSION* session_;
    LIBSSH2_CHANNEL* channel_;
    socket_t sock_;

    SSHOutcome<void> open();
    SSHOutcome<void> exec(const std::string& command);
    SSHOutcome<void> drain(SSHResult& result);
    void collect_exit(SSHResult& result);
    void free_channel();
};

// POSIX signal number for an SSH exit-signal name ("TERM", "KILL", ...),
// or -1 if unknown.
int signal_number(const std::string& name);

// Exit code to report for a command killed by a signal: 128 + N, or plain
// 128 for names we do not know (255 stays reserved for SSH failures).
int exit_code_for_signal(const std::string& name);

// Fill in exit_code / exit_signal from what the server reported. A signal
// wins over the exit status, which libssh2 reports as 0 when absent.
void record_exit(SSHResult& result, int exit_status, const std::string& exit_signal);
