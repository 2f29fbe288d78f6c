/**
 * @file CommandRunner.hpp
 * @brief Runs shell commands and captures their standard output.
 */

#pragma once
#include <string>
#include <cstddef>

namespace reflect::infrastructure {

struct CommandResult {
    bool success = false;   ///< Started, exited with 0 and stayed under the output cap.
    int exitCode = -1;
    std::string output;
};

class CommandRunner {
public:
    /**
     * @brief Runs cmd through the shell.
     * @param maxOutputBytes Output beyond this size makes the run fail (0 = unlimited).
     */
    static CommandResult Run(const std::string& cmd, std::size_t maxOutputBytes = 0);

    /** @brief Single-quotes a value for the POSIX shell. */
    static std::string ShellQuote(const std::string& value);
};

} // namespace reflect::infrastructure
