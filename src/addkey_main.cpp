#include <iostream>
#include <vector>
#include <string>
#include "cli/args.hpp"
#include "cli/key_report.hpp"
#include "cli/relay.hpp"
#include "cli/startup.hpp"
#include "cli/theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/public_key.hpp>
#include <core/utils.hpp>
#include <managers/key_installer.hpp>
#include <ssh/runner.hpp>
#include <ssh/session.hpp>

static KeyInstallPlan make_plan(const Config& config, const AddKeyArgs& args) {
    KeyInstallPlan plan = KeyInstallPlan::from_settings(config.key_install());
    if (args.atomic) plan.atomic = true;
    if (args.check_command) plan.check_command = *args.check_command;
    if (!args.targets.empty()) {
        plan.targets.clear();
        for (size_t i = 0; i < args.targets.size(); i++) {
            plan.targets.push_back(KeyTarget{args.targets[i], i == 0});
        }
    }
    return plan;
}

int main(int argc, char** argv) {
    try {
        std::vector<std::string> argv_list(argv + 1, argv + argc);

        auto parsed = parse_addkey_args(argv_list);
        if (parsed.is_err()) {
            std::cerr << parsed.error << "\n" << addkey_usage();
            return EXIT_USAGE;
        }
        const AddKeyArgs& args = parsed.value;

        if (args.options.help) {
            std::cout << addkey_usage();
            return 0;
        }
        if (args.options.version) {
            std::cout << "sshrelay-addkey " << SSHRELAY_VERSION << "\n";
            return 0;
        }

        auto config = init_runtime(args.options, "sshrelay-addkey");
        if (config.is_err()) {
            std::cerr << "Config error: " << config.error << "\n";
            return EXIT_USAGE;
        }

        std::string key_file = args.pubkey_file.empty() ? config.value.key_install().public_key
                                                        : args.pubkey_file;
        auto key = PublicKey::load(expand_home(key_file));
        if (key.is_err()) {
            std::cerr << theme::fail(key.error);
            return EXIT_USAGE;
        }

        auto request = build_request(config.value, args.options, args.host, args.user, args.password);
        auto valid = request.validate();
        if (valid.is_err()) {
            std::cerr << valid.error << "\n" << addkey_usage();
            return EXIT_USAGE;
        }

        auto callback = make_status_callback(args.options);
        SessionManager session(request);
        auto connected = session.establish(callback);
        if (connected.is_err()) {
            std::cerr << failure_message(connected.error) << "\n";
            return EXIT_SSH_FAILURE;
        }

        SessionRunner runner(session);
        KeyInstaller installer(runner, callback);
        auto report = installer.install(key.value, make_plan(config.value, args));
        session.close();

        if (report.is_err()) {
            relay_log(LogLevel::Error, "key install aborted: " + report.error.message);
            std::cerr << failure_message(report.error) << "\n";
            return EXIT_SSH_FAILURE;
        }
        return print_key_report(report.value, std::cout);
    } catch (const std::exception& e) {
        relay_log(LogLevel::Error, std::string("fatal: ") + e.what());
        std::cerr << "sshrelay-addkey: " << e.what() << "\n";
        return EXIT_SSH_FAILURE;
    }
}
