/**
 * @file CommandRunner.cpp
 * @brief Implementation of CommandRunner.
 */

#include "infrastructure/CommandRunner.hpp"
#include <cstdio>
#include <iostream>
#include <sys/wait.h>

namespace reflect::infrastructure {

CommandResult CommandRunner::Run(const std::string& cmd, std::size_t maxOutputBytes) {
    CommandResult result;
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        std::cerr << "[CommandRunner] popen failed to start command." << std::endl;
        return result;
    }

    bool overflow = false;
    char buffer[4096];
    size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        if (overflow) continue; // keep draining so the child can exit
        result.output.append(buffer, n);
        if (maxOutputBytes > 0 && result.output.size() > maxOutputBytes) {
            overflow = true;
        }
    }

    int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    }

    if (overflow) {
        std::cerr << "[CommandRunner] Output exceeded " << maxOutputBytes << " bytes: " << cmd << std::endl;
        result.output.clear();
        return result;
    }
    if (result.exitCode != 0) {
        std::cerr << "[CommandRunner] Command exited with code " << result.exitCode << ": " << cmd << std::endl;
        return result;
    }
    result.success = true;
    return result;
}

std::string CommandRunner::ShellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace reflect::infrastructure
