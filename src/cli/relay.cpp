#include "relay.hpp"
#include <core/constants.hpp>

std::string failure_message(const SSHError& error) {
    switch (error.kind) {
    case SSHErrorKind::AUTH:
        return "Authentication failed";
    case SSHErrorKind::PROTOCOL:
        return "SSH error: " + error.message;
    case SSHErrorKind::CONNECTION:
        return "Connection error: " + error.message;
    }
    return "SSH error: " + error.message;
}

int relay_outcome(const SSHOutcome<SSHResult>& outcome, std::ostream& out, std::ostream& err) {
    if (outcome.is_err()) {
        out.flush();
        err << failure_message(outcome.error) << "\n";
        err.flush();
        return EXIT_SSH_FAILURE;
    }

    const SSHResult& r = outcome.value;
    out.write(r.stdout_data.data(), static_cast<std::streamsize>(r.stdout_data.size()));
    out.flush();

    if (!r.stderr_data.empty()) {
        err.write(r.stderr_data.data(), static_cast<std::streamsize>(r.stderr_data.size()));
    }
    if (r.signaled()) {
        err << "Remote command terminated by signal " << r.exit_signal << "\n";
    }
    err.flush();

    if (r.exit_code < 0 || r.exit_code > 255) return EXIT_SSH_FAILURE;
    return r.exit_code;
}
