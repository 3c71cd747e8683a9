#include "config.hpp"
#include "constants.hpp"
#include "log.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

Result<HostKeyPolicy> parse_host_key_policy(const std::string& name) {
    if (name == "strict") return Result<HostKeyPolicy>::Ok(HostKeyPolicy::STRICT);
    if (name == "accept-new") return Result<HostKeyPolicy>::Ok(HostKeyPolicy::ACCEPT_NEW);
    if (name == "accept-any") return Result<HostKeyPolicy>::Ok(HostKeyPolicy::ACCEPT_ANY);
    return Result<HostKeyPolicy>::Err(
        "Unknown host key policy '" + name + "' (expected strict, accept-new or accept-any)");
}

const char* to_string(HostKeyPolicy policy) {
    switch (policy) {
    case HostKeyPolicy::STRICT:     return "strict";
    case HostKeyPolicy::ACCEPT_NEW: return "accept-new";
    case HostKeyPolicy::ACCEPT_ANY: return "accept-any";
    }
    return "unknown";
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".sshrelay";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

bool global_config_exists() {
    std::error_code ec;
    return fs::exists(get_global_config_path(), ec);
}

// Applies YAML sections on top of a Config, validating as it goes.
class ConfigBuilder {
public:
    explicit ConfigBuilder(Config base) : config_(std::move(base)) {}

    Result<void> apply(const YAML::Node& root) {
        if (!root || root.IsNull()) return Result<void>::Ok();
        if (!root.IsMap()) return Result<void>::Err("top level must be a mapping");

        if (root["ssh"]) {
            auto r = apply_ssh(root["ssh"]);
            if (r.is_err()) return r;
        }
        if (root["log"]) {
            auto r = apply_log(root["log"]);
            if (r.is_err()) return r;
        }
        if (root["key_install"]) {
            auto r = apply_key_install(root["key_install"]);
            if (r.is_err()) return r;
        }
        return Result<void>::Ok();
    }

    Config build(const fs::path& source) {
        config_.source_ = source;
        return config_;
    }

private:
    Config config_;

    // Read node[key] into out if present. Unlike as<T>(fallback), a value
    // that does not convert is an error rather than silently ignored.
    template <typename T>
    static Result<void> read_scalar(const YAML::Node& node, const char* key,
                                    const std::string& where, T& out) {
        const YAML::Node value = node[key];
        if (!value || value.IsNull()) return Result<void>::Ok();
        if (!value.IsScalar()) return Result<void>::Err(where + " must be a single value");
        try {
            out = value.as<T>();
        } catch (const YAML::BadConversion&) {
            return Result<void>::Err(fmt::format("{}: invalid value '{}'", where, value.Scalar()));
        }
        return Result<void>::Ok();
    }

    Result<void> apply_ssh(const YAML::Node& node) {
        SSHSettings& ssh = config_.ssh_;
        auto r = read_scalar(node, "port", "ssh.port", ssh.port);
        if (r.is_ok()) r = read_scalar(node, "timeout", "ssh.timeout", ssh.timeout);
        if (r.is_ok()) r = read_scalar(node, "known_hosts", "ssh.known_hosts", ssh.known_hosts);
        if (r.is_err()) return r;

        if (node["host_key_policy"]) {
            auto policy = parse_host_key_policy(node["host_key_policy"].as<std::string>());
            if (policy.is_err()) return Result<void>::Err("ssh.host_key_policy: " + policy.error);
            ssh.host_key_policy = policy.value;
        }

        if (ssh.port < 1 || ssh.port > 65535) {
            return Result<void>::Err(fmt::format("ssh.port {} out of range", ssh.port));
        }
        if (ssh.timeout <= 0 || ssh.timeout > SSH_MAX_TIMEOUT_SECS) {
            return Result<void>::Err(fmt::format("ssh.timeout must be 1..{}", SSH_MAX_TIMEOUT_SECS));
        }
        return Result<void>::Ok();
    }

    Result<void> apply_log(const YAML::Node& node) {
        LogSettings& log = config_.log_;
        log.file = node["file"].as<std::string>(log.file);
        log.level = node["level"].as<std::string>(log.level);

        LogLevel parsed;
        if (!parse_log_level(log.level, parsed)) {
            return Result<void>::Err("log.level: unknown level '" + log.level + "'");
        }
        return Result<void>::Ok();
    }

    Result<void> apply_key_install(const YAML::Node& node) {
        KeyInstallSettings& ki = config_.key_install_;
        auto r = read_scalar(node, "check_command", "key_install.check_command", ki.check_command);
        if (r.is_ok()) r = read_scalar(node, "atomic", "key_install.atomic", ki.atomic);
        if (r.is_ok()) r = read_scalar(node, "public_key", "key_install.public_key", ki.public_key);
        if (r.is_err()) return r;

        if (node["targets"]) {
            if (!node["targets"].IsSequence()) {
                return Result<void>::Err("key_install.targets must be a list");
            }
            std::vector<KeyTarget> targets;
            for (const auto& t : node["targets"]) {
                KeyTarget target;
                if (t.IsScalar()) {
                    // Bare path shorthand: best-effort target
                    target.path = t.as<std::string>();
                } else if (t.IsMap()) {
                    auto fields = read_scalar(t, "path", "key_install target path", target.path);
                    if (fields.is_ok()) {
                        fields = read_scalar(t, "required", "key_install target required", target.required);
                    }
                    if (fields.is_err()) return fields;
                } else {
                    return Result<void>::Err("key_install.targets entries must be paths or maps");
                }
                if (target.path.empty() || target.path[0] != '/') {
                    return Result<void>::Err("key_install target path must be absolute: '" + target.path + "'");
                }
                targets.push_back(target);
            }
            if (targets.empty()) {
                return Result<void>::Err("key_install.targets must not be empty");
            }
            ki.targets = targets;
        }
        return Result<void>::Ok();
    }
};

Config Config::defaults() {
    Config config;
    config.log_.file = default_log_path();
    config.key_install_.check_command = DEFAULT_KEY_CHECK_COMMAND;
    config.key_install_.public_key = DEFAULT_PUBLIC_KEY_FILE;
    config.key_install_.targets = {
        KeyTarget{DEFAULT_KEY_TARGET_JFFS, true},
        KeyTarget{DEFAULT_KEY_TARGET_DROPBEAR, false},
    };
    return config;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        ConfigBuilder builder(defaults());
        auto applied = builder.apply(YAML::Load(yaml_text));
        if (applied.is_err()) return Result<Config>::Err(applied.error);
        return Result<Config>::Ok(builder.build(fs::path()));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(std::string("Invalid config: ") + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    try {
        ConfigBuilder builder(defaults());
        auto applied = builder.apply(YAML::LoadFile(path.string()));
        if (applied.is_err()) {
            return Result<Config>::Err(path.string() + ": " + applied.error);
        }
        return Result<Config>::Ok(builder.build(path));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err("Failed to parse " + path.string() + ": " + e.what());
    }
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Ok(defaults());
    }
    return load_file(get_global_config_path());
}

Result<Config> Config::load(const std::string& explicit_path) {
    if (!explicit_path.empty()) {
        return load_file(fs::path(explicit_path));
    }
    return load_global();
}
