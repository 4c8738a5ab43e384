#include "infrastructure/ProcessRunner.hpp"
#include <cstdio>
#include <cstdlib>
#include <sys/wait.h>

namespace symbolgate::infrastructure {

ProcessRunner::Result ProcessRunner::Run(const std::string& command) {
    Result result;
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        return result;
    }

    char buffer[4096];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        result.output.append(buffer, n);
    }

    int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    }
    return result;
}

bool ProcessRunner::HasTool(const std::string& tool) {
    std::string cmd = "command -v " + Quote(tool) + " >/dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

std::string ProcessRunner::Quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace symbolgate::infrastructure
