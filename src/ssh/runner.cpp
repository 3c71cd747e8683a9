#include "runner.hpp"
#include "exec_channel.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

SessionRunner::SessionRunner(SessionManager& session)
    : session_(session) {
}

SSHOutcome<SSHResult> SessionRunner::run(const std::string& command) {
    if (!session_.is_active()) {
        return SSHOutcome<SSHResult>::Err(SSHErrorKind::PROTOCOL, "Session is not connected");
    }
    ExecChannel channel(session_.get_raw_session(), session_.get_socket());
    return channel.run(command);
}

SSHOutcome<SSHResult> run_remote(const ConnectionRequest& request,
                                 const std::string& command,
                                 StatusCallback callback) {
    SessionManager session(request);

    auto connected = session.establish(callback);
    if (connected.is_err()) {
        return SSHOutcome<SSHResult>::Err(connected.error);
    }

    SessionRunner runner(session);
    auto result = runner.run(command);
    if (result.is_ok()) {
        relay_log(fmt::format("{} exited with {}", session.get_target(), result.value.exit_code));
    } else {
        relay_log(LogLevel::Error, fmt::format("{} {} error: {}", session.get_target(),
                                               to_string(result.error.kind), result.error.message));
    }

    session.close();
    return result;
}
