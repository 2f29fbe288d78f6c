/**
 * @file ReflectApp.hpp
 * @brief Command-line application class for Reflect.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include "infrastructure/PathUtils.hpp"

namespace reflect::app {

/**
 * @struct CommandLine
 * @brief Parsed arguments.
 */
struct CommandLine {
    enum class Mode { Reflect, Config, History, Dates, Help };

    Mode mode = Mode::Reflect;
    std::optional<std::string> targetPath;
    std::optional<std::string> date;
    bool dryRun = false;
    bool save = false;
    std::string error; ///< Non-empty when the arguments could not be parsed.

    static CommandLine Parse(const std::vector<std::string>& args);
};

/**
 * @class ReflectApp
 * @brief Wires the infrastructure adapters into the reflection service and runs one command.
 */
class ReflectApp {
public:
    explicit ReflectApp(infrastructure::ReflectPaths paths = infrastructure::PathUtils::GetReflectPaths());

    /**
     * @brief Runs the command described by argv.
     * @return Process exit code (0 for success).
     */
    int Run(int argc, char** argv);

    int Run(const CommandLine& cmd);

    static std::string Usage();

private:
    int RunReflection(const CommandLine& cmd);
    int ShowConfig();
    int ShowHistory();
    int ShowDates();

    infrastructure::ReflectPaths m_paths;
};

} // namespace reflect::app
