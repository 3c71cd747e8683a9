#include "startup.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <iostream>

Result<Config> init_runtime(const CommonOptions& options, const std::string& tool_name) {
    auto config = Config::load(options.config_path);
    if (config.is_err()) return config;

    LogLevel level = LogLevel::Info;
    if (!parse_log_level(config.value.log().level, level)) level = LogLevel::Info;
    if (options.verbose && level > LogLevel::Debug) level = LogLevel::Debug;
    relay_log_configure(config.value.log().file, level);

    relay_log("========================================");
    relay_log(fmt::format("{} {} (config: {})", tool_name, SSHRELAY_VERSION,
                          config.value.source().empty() ? "defaults" : config.value.source().string()));
    return config;
}

StatusCallback make_status_callback(const CommonOptions& options) {
    if (!options.verbose) return nullptr;
    return [](const std::string& msg) {
        std::cerr << theme::log(msg) << std::flush;
    };
}
