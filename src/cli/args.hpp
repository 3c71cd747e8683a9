#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include <ssh/session.hpp>

// Options shared by both tools. Unset optionals fall back to the config file.
struct CommonOptions {
    std::optional<int> port;
    std::optional<int> timeout;
    std::optional<HostKeyPolicy> host_key_policy;
    std::optional<std::string> known_hosts;
    std::string config_path;
    bool verbose = false;
    bool help = false;
    bool version = false;
};

// sshrelay [options] <host> <user> <password> <command...>
struct RelayArgs {
    CommonOptions options;
    std::string host;
    std::string user;
    std::string password;
    std::string command;
};

// sshrelay-addkey [options] <host> <user> <password> [pubkey-file]
struct AddKeyArgs {
    CommonOptions options;
    std::string host;
    std::string user;
    std::string password;
    std::string pubkey_file;                  // empty → config default
    bool atomic = false;
    std::optional<std::string> check_command;
    std::vector<std::string> targets;         // non-empty replaces config targets
};

// args excludes argv[0]. --help / --version short-circuit the positional
// checks; callers test options.help / options.version first.
Result<RelayArgs> parse_relay_args(const std::vector<std::string>& args);
Result<AddKeyArgs> parse_addkey_args(const std::vector<std::string>& args);

std::string relay_usage();
std::string addkey_usage();

// Merge config and command-line options into a connection request.
ConnectionRequest build_request(const Config& config, const CommonOptions& options,
                                const std::string& host, const std::string& user,
                                const std::string& password);
