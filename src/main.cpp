#include <iostream>
#include <vector>
#include <string>
#include "cli/args.hpp"
#include "cli/relay.hpp"
#include "cli/startup.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <ssh/runner.hpp>

int main(int argc, char** argv) {
    platform::set_binary_stdio();

    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        // Nothing touches the network until the arguments are known good
        auto parsed = parse_relay_args(args);
        if (parsed.is_err()) {
            std::cerr << parsed.error << "\n" << relay_usage();
            return EXIT_USAGE;
        }
        const RelayArgs& relay = parsed.value;

        if (relay.options.help) {
            std::cout << relay_usage();
            return 0;
        }
        if (relay.options.version) {
            std::cout << "sshrelay " << SSHRELAY_VERSION << "\n";
            return 0;
        }

        auto config = init_runtime(relay.options, "sshrelay");
        if (config.is_err()) {
            std::cerr << "Config error: " << config.error << "\n";
            return EXIT_USAGE;
        }

        auto request = build_request(config.value, relay.options,
                                     relay.host, relay.user, relay.password);
        auto valid = request.validate();
        if (valid.is_err()) {
            std::cerr << valid.error << "\n" << relay_usage();
            return EXIT_USAGE;
        }

        auto outcome = run_remote(request, relay.command, make_status_callback(relay.options));
        return relay_outcome(outcome, std::cout, std::cerr);
    } catch (const std::exception& e) {
        relay_log(LogLevel::Error, std::string("fatal: ") + e.what());
        std::cerr << "sshrelay: " << e.what() << "\n";
        return EXIT_SSH_FAILURE;
    }
}
