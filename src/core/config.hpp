#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.sshrelay/config.yaml, or defaults if it does not exist.
    static Result<Config> load_global();

    // Load a specific file (must exist).
    static Result<Config> load_file(const fs::path& path);

    // explicit_path if non-empty, else the global config.
    static Result<Config> load(const std::string& explicit_path = "");

    // Parse YAML text. Missing keys keep their defaults.
    static Result<Config> parse(const std::string& yaml_text);

    // Built-in defaults only.
    static Config defaults();

    // Accessors
    const SSHSettings& ssh() const { return ssh_; }
    const LogSettings& log() const { return log_; }
    const KeyInstallSettings& key_install() const { return key_install_; }
    const fs::path& source() const { return source_; }

public:
    Config() = default;

private:
    SSHSettings ssh_;
    LogSettings log_;
    KeyInstallSettings key_install_;
    fs::path source_;       // empty when built from defaults

    friend class ConfigBuilder;
};

// Policy names: "strict", "accept-new", "accept-any".
Result<HostKeyPolicy> parse_host_key_policy(const std::string& name);
const char* to_string(HostKeyPolicy policy);

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
bool global_config_exists();
