#pragma once

#include <string>
#include <vector>

namespace procutil {

struct ProcResult {
    int exit_code = -1;     // child exit status, or -1 when it did not exit normally
    std::string output;     // captured stdout
};

// Quotes one argument for /bin/sh.
std::string shell_quote(const std::string& arg);

// Runs argv through the shell and captures stdout. stderr is discarded.
// Throws std::runtime_error when the child cannot be started.
ProcResult run_capture(const std::vector<std::string>& argv);

} // namespace procutil
