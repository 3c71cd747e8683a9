#include "args.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

namespace {

enum class OptionParse { NOT_OURS, CONSUMED };

// Split "--name=value" into name and inline value.
void split_inline_value(const std::string& arg, std::string& name,
                        std::optional<std::string>& value) {
    auto eq = arg.find('=');
    if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
        name = arg.substr(0, eq);
        value = arg.substr(eq + 1);
    } else {
        name = arg;
        value.reset();
    }
}

// Fetch the value for an option, either inline or from the next argument.
Result<std::string> take_value(const std::vector<std::string>& args, size_t& i,
                               const std::string& name,
                               const std::optional<std::string>& inline_value) {
    if (inline_value) return Result<std::string>::Ok(*inline_value);
    if (i + 1 >= args.size()) {
        return Result<std::string>::Err("Option " + name + " requires a value");
    }
    return Result<std::string>::Ok(args[++i]);
}

Result<OptionParse> parse_common_option(const std::vector<std::string>& args, size_t& i,
                                        CommonOptions& opts) {
    std::string name;
    std::optional<std::string> inline_value;
    split_inline_value(args[i], name, inline_value);

    if (name == "-h" || name == "--help") {
        opts.help = true;
        return Result<OptionParse>::Ok(OptionParse::CONSUMED);
    }
    if (name == "--version") {
        opts.version = true;
        return Result<OptionParse>::Ok(OptionParse::CONSUMED);
    }
    if (name == "-v" || name == "--verbose") {
        opts.verbose = true;
        return Result<OptionParse>::Ok(OptionParse::CONSUMED);
    }

    if (name == "-p" || name == "--port") {
        auto v = take_value(args, i, name, inline_value);
        if (v.is_err()) return Result<OptionParse>::Err(v.error);
        int port = safe_stoi(v.value, -1);
        if (port < 1 || port > 65535) {
            return Result<OptionParse>::Err("Invalid port: " + v.value);
        }
        opts.port = port;
        return Result<OptionParse>::Ok(OptionParse::CONSUMED);
    }
    if (name == "-t" || name == "--timeout") {
        auto v = take_value(args, i, name, inline_value);
        if (v.is_err()) return Result<OptionParse>::Err(v.error);
        int timeout = safe_stoi(v.value, -1);
        if (timeout <= 0 || timeout > SSH_MAX_TIMEOUT_SECS) {
            return Result<OptionParse>::Err("Invalid timeout: " + v.value);
        }
        opts.timeout = timeout;
        return Result<OptionParse>::Ok(OptionParse::CONSUMED);
    }
    if (name == "--host-key-policy") {
        auto v = take_value(args, i, name, inline_value);
        if (v.is_err()) return Result<OptionParse>::Err(v.error);
        auto policy = parse_host_key_policy(v.value);
        if (policy.is_err()) return Result<OptionParse>::Err(policy.error);
        opts.host_key_policy = policy.value;
        return Result<OptionParse>::Ok(OptionParse::CONSUMED);
    }
    if (name == "--known-hosts") {
        auto v = take_value(args, i, name, inline_value);
        if (v.is_err()) return Result<OptionParse>::Err(v.error);
        opts.known_hosts = v.value;
        return Result<OptionParse>::Ok(OptionParse::CONSUMED);
    }
    if (name == "-c" || name == "--config") {
        auto v = take_value(args, i, name, inline_value);
        if (v.is_err()) return Result<OptionParse>::Err(v.error);
        opts.config_path = v.value;
        return Result<OptionParse>::Ok(OptionParse::CONSUMED);
    }

    return Result<OptionParse>::Ok(OptionParse::NOT_OURS);
}

bool looks_like_option(const std::string& arg) {
    return arg.size() > 1 && arg[0] == '-';
}

} // namespace

Result<RelayArgs> parse_relay_args(const std::vector<std::string>& args) {
    RelayArgs out;
    std::vector<std::string> positional;

    size_t i = 0;
    for (; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--") { i++; break; }
        if (!looks_like_option(arg)) break;

        auto r = parse_common_option(args, i, out.options);
        if (r.is_err()) return Result<RelayArgs>::Err(r.error);
        if (r.value == OptionParse::NOT_OURS) {
            return Result<RelayArgs>::Err("Unknown option: " + arg);
        }
    }
    // Everything after the options is positional, so remote commands can
    // carry their own flags.
    for (; i < args.size(); i++) positional.push_back(args[i]);

    if (out.options.help || out.options.version) {
        return Result<RelayArgs>::Ok(out);
    }

    if (positional.size() < 4) {
        return Result<RelayArgs>::Err("Expected <host> <user> <password> <command>");
    }

    out.host = positional[0];
    out.user = positional[1];
    out.password = positional[2];
    out.command = positional[3];
    for (size_t k = 4; k < positional.size(); k++) {
        out.command += " " + positional[k];
    }
    return Result<RelayArgs>::Ok(out);
}

Result<AddKeyArgs> parse_addkey_args(const std::vector<std::string>& args) {
    AddKeyArgs out;
    std::vector<std::string> positional;

    size_t i = 0;
    for (; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--") { i++; break; }
        if (!looks_like_option(arg)) break;

        auto r = parse_common_option(args, i, out.options);
        if (r.is_err()) return Result<AddKeyArgs>::Err(r.error);
        if (r.value == OptionParse::CONSUMED) continue;

        std::string name;
        std::optional<std::string> inline_value;
        split_inline_value(arg, name, inline_value);

        if (name == "--atomic") {
            out.atomic = true;
        } else if (name == "--check-command") {
            auto v = take_value(args, i, name, inline_value);
            if (v.is_err()) return Result<AddKeyArgs>::Err(v.error);
            out.check_command = v.value;
        } else if (name == "--target") {
            auto v = take_value(args, i, name, inline_value);
            if (v.is_err()) return Result<AddKeyArgs>::Err(v.error);
            if (v.value.empty() || v.value[0] != '/') {
                return Result<AddKeyArgs>::Err("Target path must be absolute: " + v.value);
            }
            out.targets.push_back(v.value);
        } else {
            return Result<AddKeyArgs>::Err("Unknown option: " + arg);
        }
    }
    for (; i < args.size(); i++) positional.push_back(args[i]);

    if (out.options.help || out.options.version) {
        return Result<AddKeyArgs>::Ok(out);
    }

    if (positional.size() < 3 || positional.size() > 4) {
        return Result<AddKeyArgs>::Err("Expected <host> <user> <password> [pubkey-file]");
    }

    out.host = positional[0];
    out.user = positional[1];
    out.password = positional[2];
    if (positional.size() == 4) out.pubkey_file = positional[3];
    return Result<AddKeyArgs>::Ok(out);
}

static const char* COMMON_OPTIONS_HELP =
    "  -p, --port N              SSH port (default 22)\n"
    "  -t, --timeout S           connect/handshake/auth timeout in seconds (default 15)\n"
    "      --host-key-policy P   strict | accept-new | accept-any (default accept-any)\n"
    "      --known-hosts FILE    known_hosts file (default ~/.ssh/known_hosts)\n"
    "  -c, --config FILE         YAML config (default ~/.sshrelay/config.yaml)\n"
    "  -v, --verbose             progress messages on stderr\n"
    "  -h, --help                show this help\n"
    "      --version             show version\n";

std::string relay_usage() {
    return fmt::format(
        "Usage: sshrelay [options] <host> <user> <password> <command>\n"
        "\n"
        "Runs <command> on <host> over SSH and relays its stdout, stderr and exit status.\n"
        "Exit status: the remote status, 128+N if killed by signal N (128 if the\n"
        "signal is unknown), 1 on bad arguments, 255 on SSH failure.\n"
        "\n"
        "Options:\n{}", COMMON_OPTIONS_HELP);
}

std::string addkey_usage() {
    return fmt::format(
        "Usage: sshrelay-addkey [options] <host> <user> <password> [pubkey-file]\n"
        "\n"
        "Appends a public key to the router's authorized_keys files unless it is already there.\n"
        "\n"
        "Options:\n{}"
        "      --atomic              check and append in a single remote command per target\n"
        "      --check-command CMD   command whose output lists installed keys\n"
        "                            (default: {})\n"
        "      --target PATH         authorized_keys file to update (repeatable;\n"
        "                            the first one is required)\n",
        COMMON_OPTIONS_HELP, DEFAULT_KEY_CHECK_COMMAND);
}

ConnectionRequest build_request(const Config& config, const CommonOptions& options,
                                const std::string& host, const std::string& user,
                                const std::string& password) {
    ConnectionRequest request;
    request.host = host;
    request.user = user;
    request.password = password;
    request.port = options.port.value_or(config.ssh().port);
    request.timeout = options.timeout.value_or(config.ssh().timeout);
    request.host_key_policy = options.host_key_policy.value_or(config.ssh().host_key_policy);
    request.known_hosts_path = options.known_hosts.value_or(config.ssh().known_hosts);
    return request;
}
