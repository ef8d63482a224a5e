#include "util/ProcUtil.hpp"

#include <cstdio>
#include <sys/wait.h>

namespace procutil {

ProcResult run_capture(const std::string& cmdline) {
    ProcResult res;

    const std::string merged = cmdline + " 2>&1";
    FILE* pipe = popen(merged.c_str(), "r");
    if (!pipe) return res;

    res.output.reserve(8192);
    char buf[4096];
    size_t n = 0;
    while ((n = fread(buf, 1, sizeof(buf), pipe)) > 0) {
        res.output.append(buf, buf + n);
    }

    int status = pclose(pipe);
    if (status == -1) return res;
    res.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return res;
}

std::string shell_quote(const std::string& s) {
    std::string o = "'";
    for (char c : s) {
        if (c == '\'') o += "'\\''";
        else o += c;
    }
    o += "'";
    return o;
}

} // namespace procutil
