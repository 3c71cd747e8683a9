#pragma once

#include <ostream>
#include <string>
#include <ssh/result.hpp>

// One-line diagnostic for a failed run:
//   AUTH       → "Authentication failed"
//   PROTOCOL   → "SSH error: <message>"
//   CONNECTION → "Connection error: <message>"
std::string failure_message(const SSHError& error);

// Forward a run outcome to the caller's streams and return the exit code.
// On success stdout is written verbatim, stderr only if non-empty, and the
// remote exit status is returned. On failure one diagnostic line goes to
// err and the result is 255.
int relay_outcome(const SSHOutcome<SSHResult>& outcome, std::ostream& out, std::ostream& err);
