#pragma once

#include <string>
#include <core/types.hpp>
#include "result.hpp"
#include "session.hpp"

// Something that can run a shell command on the remote side.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual SSHOutcome<SSHResult> run(const std::string& command) = 0;
};

// Runs commands over an established session, one exec channel each.
class SessionRunner : public CommandRunner {
public:
    explicit SessionRunner(SessionManager& session);

    SSHOutcome<SSHResult> run(const std::string& command) override;

private:
    SessionManager& session_;
};

// Open a session, run command exactly once, close the session.
// The session is closed on every path, including failures.
SSHOutcome<SSHResult> run_remote(const ConnectionRequest& request,
                                 const std::string& command,
                                 StatusCallback callback = nullptr);
