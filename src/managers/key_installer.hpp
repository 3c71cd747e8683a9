#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/public_key.hpp>
#include <ssh/runner.hpp>

enum class TargetStatus {
    APPENDED,
    ALREADY_PRESENT,
    FAILED,
};

const char* to_string(TargetStatus status);

struct TargetOutcome {
    std::string path;
    bool required = false;
    TargetStatus status = TargetStatus::FAILED;
    std::string detail;
};

struct KeyInstallReport {
    bool already_present = false;       // found by the check command, nothing touched
    std::vector<TargetOutcome> targets;

    bool required_failed() const;
    bool changed() const;
};

struct KeyInstallPlan {
    std::string check_command;          // empty → skip the global check
    std::vector<KeyTarget> targets;
    bool atomic = false;

    static KeyInstallPlan from_settings(const KeyInstallSettings& settings);
};

// Appends a public key to the router's authorized_keys files, at most once.
//
// Default mode is check-then-act: read the credential store, and only
// append where the key is missing. Nothing locks the remote files, so two
// concurrent installs can both append. Atomic mode folds the check and the
// append for each target into one remote shell command.
class KeyInstaller {
public:
    explicit KeyInstaller(CommandRunner& runner, StatusCallback callback = nullptr);

    // SSH failures abort the install; a failing remote command only marks
    // its target as FAILED.
    SSHOutcome<KeyInstallReport> install(const PublicKey& key, const KeyInstallPlan& plan);

    static std::string read_command(const std::string& path);
    static std::string append_command(const PublicKey& key, const std::string& path,
                                      bool needs_leading_newline);
    static std::string conditional_append_command(const PublicKey& key, const std::string& path);

private:
    CommandRunner& runner_;
    StatusCallback callback_;

    SSHOutcome<TargetOutcome> install_checked(const PublicKey& key, const KeyTarget& target);
    SSHOutcome<TargetOutcome> install_atomic(const PublicKey& key, const KeyTarget& target);
};
