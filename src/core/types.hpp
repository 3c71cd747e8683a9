#pragma once

#include <string>
#include <vector>
#include <functional>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// How an unknown or changed server host key is treated.
enum class HostKeyPolicy {
    STRICT,       // key must already be in known_hosts and match
    ACCEPT_NEW,   // unknown keys are recorded, changed keys are rejected
    ACCEPT_ANY,   // no verification at all
};

// Configuration structures
struct SSHSettings {
    int port = 22;
    int timeout = 15;
    HostKeyPolicy host_key_policy = HostKeyPolicy::ACCEPT_ANY;
    std::string known_hosts;     // empty → ~/.ssh/known_hosts
};

struct LogSettings {
    std::string file;            // empty → logging disabled
    std::string level = "info";
};

struct KeyTarget {
    std::string path;
    bool required = false;
};

struct KeyInstallSettings {
    std::string check_command;
    bool atomic = false;
    std::vector<KeyTarget> targets;
    std::string public_key;      // default public key file
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
