#pragma once
#include <string>

namespace procutil {

struct ProcResult {
    int exit_code = -1;   // -1 if the process could not be started
    std::string output;   // captured stdout+stderr (merged)
};

// Runs a shell command line and captures its merged output.
ProcResult run_capture(const std::string& cmdline);

// Single-quotes s for /bin/sh.
std::string shell_quote(const std::string& s);

} // namespace procutil
