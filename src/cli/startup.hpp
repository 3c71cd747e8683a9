#pragma once

#include <core/config.hpp>
#include <core/types.hpp>
#include "args.hpp"

// Load the config named by the options (or the global one) and point the
// debug log at the configured file.
Result<Config> init_runtime(const CommonOptions& options, const std::string& tool_name);

// Progress callback for --verbose: dim lines on stderr. nullptr otherwise.
StatusCallback make_status_callback(const CommonOptions& options);
