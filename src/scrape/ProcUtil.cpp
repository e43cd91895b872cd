#include "scrape/ProcUtil.hpp"

#include <cstdio>
#include <stdexcept>
#include <sys/wait.h>

namespace procutil {

std::string shell_quote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

ProcResult run_capture(const std::vector<std::string>& argv) {
    if (argv.empty()) throw std::runtime_error("run_capture: empty command");

    std::string cmdline;
    for (const auto& a : argv) {
        if (!cmdline.empty()) cmdline += ' ';
        cmdline += shell_quote(a);
    }
    cmdline += " 2>/dev/null";

    FILE* pipe = ::popen(cmdline.c_str(), "r");
    if (!pipe) throw std::runtime_error("run_capture: cannot start " + argv.front());

    ProcResult res;
    res.output.reserve(8192);

    char buf[4096];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) {
        res.output.append(buf, buf + n);
    }

    const int status = ::pclose(pipe);
    if (status != -1 && WIFEXITED(status)) res.exit_code = WEXITSTATUS(status);

    return res;
}

} // namespace procutil
