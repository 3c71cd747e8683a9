#include "key_report.hpp"
#include "theme.hpp"
#include <core/constants.hpp>

int print_key_report(const KeyInstallReport& report, std::ostream& out) {
    if (report.already_present) {
        out << theme::ok("Key already present");
        return 0;
    }

    for (const auto& t : report.targets) {
        switch (t.status) {
        case TargetStatus::APPENDED:
            out << theme::ok("Key added to " + t.path);
            break;
        case TargetStatus::ALREADY_PRESENT:
            out << theme::info("Key already in " + t.path);
            break;
        case TargetStatus::FAILED: {
            std::string msg = "Could not update " + t.path;
            if (!t.detail.empty()) msg += ": " + t.detail;
            out << (t.required ? theme::fail(msg) : theme::warn(msg + " (optional)"));
            break;
        }
        }
    }

    return report.required_failed() ? EXIT_TARGET_FAILED : 0;
}
