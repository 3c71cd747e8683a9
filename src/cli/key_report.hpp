#pragma once

#include <ostream>
#include <managers/key_installer.hpp>

// Print a per-target summary and return the process exit code:
// 0 when the key is (now) installed everywhere required, 2 otherwise.
int print_key_report(const KeyInstallReport& report, std::ostream& out);
