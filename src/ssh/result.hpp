#pragma once

#include <string>
#include <utility>

// Remote command execution result
struct SSHResult {
    int exit_code = 0;
    std::string stdout_data;
    std::string stderr_data;
    std::string exit_signal;    // signal name without "SIG", empty on normal exit

    bool success() const { return exit_code == 0 && exit_signal.empty(); }
    bool failed() const { return !success(); }
    bool signaled() const { return !exit_signal.empty(); }
};

// The three ways an SSH step can fail before a remote exit status exists.
enum class SSHErrorKind {
    CONNECTION,   // resolve / connect / timeout / refused
    AUTH,         // credentials rejected
    PROTOCOL,     // handshake, host key, channel or transport failure
};

struct SSHError {
    SSHErrorKind kind = SSHErrorKind::PROTOCOL;
    std::string message;
};

inline const char* to_string(SSHErrorKind kind) {
    switch (kind) {
    case SSHErrorKind::CONNECTION: return "connection";
    case SSHErrorKind::AUTH:       return "auth";
    case SSHErrorKind::PROTOCOL:   return "protocol";
    }
    return "unknown";
}

// Like Result<T>, but failures carry an SSHErrorKind.
template <typename T>
struct SSHOutcome {
    bool success;
    T value;
    SSHError error;

    static SSHOutcome<T> Ok(T val) {
        return {true, std::move(val), SSHError{}};
    }

    static SSHOutcome<T> Err(SSHErrorKind kind, const std::string& msg) {
        return {false, T{}, SSHError{kind, msg}};
    }

    static SSHOutcome<T> Err(const SSHError& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

template <>
struct SSHOutcome<void> {
    bool success;
    SSHError error;

    static SSHOutcome<void> Ok() {
        return {true, SSHError{}};
    }

    static SSHOutcome<void> Err(SSHErrorKind kind, const std::string& msg) {
        return {false, SSHError{kind, msg}};
    }

    static SSHOutcome<void> Err(const SSHError& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};
