#include "key_installer.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

const char* to_string(TargetStatus status) {
    switch (status) {
    case TargetStatus::APPENDED:        return "appended";
    case TargetStatus::ALREADY_PRESENT: return "already present";
    case TargetStatus::FAILED:          return "failed";
    }
    return "unknown";
}

bool KeyInstallReport::required_failed() const {
    for (const auto& t : targets) {
        if (t.required && t.status == TargetStatus::FAILED) return true;
    }
    return false;
}

bool KeyInstallReport::changed() const {
    for (const auto& t : targets) {
        if (t.status == TargetStatus::APPENDED) return true;
    }
    return false;
}

KeyInstallPlan KeyInstallPlan::from_settings(const KeyInstallSettings& settings) {
    KeyInstallPlan plan;
    plan.check_command = settings.check_command;
    plan.targets = settings.targets;
    plan.atomic = settings.atomic;
    return plan;
}

// ── remote commands ─────────────────────────────────────────────────

std::string KeyInstaller::read_command(const std::string& path) {
    return "cat " + shell_quote(path) + " 2>/dev/null";
}

std::string KeyInstaller::append_command(const PublicKey& key, const std::string& path,
                                         bool needs_leading_newline) {
    const char* format = needs_leading_newline ? "'\\n%s\\n'" : "'%s\\n'";
    return fmt::format("mkdir -p {} 2>/dev/null; printf {} {} >> {}",
                       shell_quote(remote_dirname(path)), format,
                       shell_quote(key.line()), shell_quote(path));
}

std::string KeyInstaller::conditional_append_command(const PublicKey& key, const std::string& path) {
    std::string file = shell_quote(path);
    return fmt::format(
        "mkdir -p {dir} 2>/dev/null; "
        "if grep -qF {blob} {file} 2>/dev/null; then echo present; "
        "else {{ [ -s {file} ] && [ -n \"$(tail -c 1 {file})\" ] && echo >> {file}; "
        "printf '%s\\n' {line} >> {file}; }} && echo appended; fi",
        fmt::arg("dir", shell_quote(remote_dirname(path))),
        fmt::arg("blob", shell_quote(key.blob)),
        fmt::arg("file", file),
        fmt::arg("line", shell_quote(key.line())));
}

// ── KeyInstaller ────────────────────────────────────────────────────

KeyInstaller::KeyInstaller(CommandRunner& runner, StatusCallback callback)
    : runner_(runner), callback_(std::move(callback)) {
}

static std::string failure_detail(const SSHResult& r) {
    std::string err = r.stderr_data;
    trim(err);
    if (!err.empty()) return err;
    return fmt::format("exit {}", r.exit_code);
}

SSHOutcome<TargetOutcome> KeyInstaller::install_checked(const PublicKey& key, const KeyTarget& target) {
    TargetOutcome outcome;
    outcome.path = target.path;
    outcome.required = target.required;

    auto current = runner_.run(read_command(target.path));
    if (current.is_err()) return SSHOutcome<TargetOutcome>::Err(current.error);

    // A missing file reads as empty
    const std::string& content = current.value.stdout_data;
    if (content.find(key.blob) != std::string::npos) {
        outcome.status = TargetStatus::ALREADY_PRESENT;
        return SSHOutcome<TargetOutcome>::Ok(outcome);
    }

    bool needs_newline = !content.empty() && content.back() != '\n';
    auto appended = runner_.run(append_command(key, target.path, needs_newline));
    if (appended.is_err()) return SSHOutcome<TargetOutcome>::Err(appended.error);

    if (appended.value.failed()) {
        outcome.status = TargetStatus::FAILED;
        outcome.detail = failure_detail(appended.value);
    } else {
        outcome.status = TargetStatus::APPENDED;
    }
    return SSHOutcome<TargetOutcome>::Ok(outcome);
}

SSHOutcome<TargetOutcome> KeyInstaller::install_atomic(const PublicKey& key, const KeyTarget& target) {
    TargetOutcome outcome;
    outcome.path = target.path;
    outcome.required = target.required;

    auto r = runner_.run(conditional_append_command(key, target.path));
    if (r.is_err()) return SSHOutcome<TargetOutcome>::Err(r.error);

    std::string out = r.value.stdout_data;
    trim(out);
    if (r.value.success() && out == "present") {
        outcome.status = TargetStatus::ALREADY_PRESENT;
    } else if (r.value.success() && out == "appended") {
        outcome.status = TargetStatus::APPENDED;
    } else {
        outcome.status = TargetStatus::FAILED;
        outcome.detail = failure_detail(r.value);
    }
    return SSHOutcome<TargetOutcome>::Ok(outcome);
}

SSHOutcome<KeyInstallReport> KeyInstaller::install(const PublicKey& key, const KeyInstallPlan& plan) {
    KeyInstallReport report;
    relay_log(fmt::format("key install: {} key '{}' into {} target(s){}", key.type, key.comment,
                          plan.targets.size(), plan.atomic ? " (atomic)" : ""));

    if (!plan.check_command.empty()) {
        if (callback_) callback_("Checking " + plan.check_command + "...");
        auto check = runner_.run(plan.check_command);
        if (check.is_err()) return SSHOutcome<KeyInstallReport>::Err(check.error);

        if (check.value.failed()) {
            relay_log(LogLevel::Warn, fmt::format("check command '{}' failed: {}",
                                                  plan.check_command, failure_detail(check.value)));
        } else if (check.value.stdout_data.find(key.blob) != std::string::npos) {
            relay_log("key already present according to check command");
            report.already_present = true;
            return SSHOutcome<KeyInstallReport>::Ok(report);
        }
    }

    for (const auto& target : plan.targets) {
        if (callback_) callback_("Updating " + target.path + "...");
        auto outcome = plan.atomic ? install_atomic(key, target) : install_checked(key, target);
        if (outcome.is_err()) return SSHOutcome<KeyInstallReport>::Err(outcome.error);

        relay_log(fmt::format("target {}: {}{}", target.path, to_string(outcome.value.status),
                              outcome.value.detail.empty() ? "" : " (" + outcome.value.detail + ")"));
        report.targets.push_back(outcome.value);
    }

    // Every target already had it: same as the check command finding it
    bool all_present = !report.targets.empty();
    for (const auto& t : report.targets) {
        if (t.status != TargetStatus::ALREADY_PRESENT) all_present = false;
    }
    if (all_present) report.already_present = true;

    return SSHOutcome<KeyInstallReport>::Ok(report);
}
