// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace reflect::infrastructure {

/**
 * @struct ReflectPaths
 * @brief Locations of configuration, session logs, backups and history for one invocation.
 */
struct ReflectPaths {
    std::filesystem::path configDir;
    std::filesystem::path configFile;
    std::filesystem::path sessionsDir;
    std::filesystem::path backupDir;
    std::filesystem::path historyFile;

    /** @brief Derives every location from a single agent directory. */
    static ReflectPaths FromAgentDir(const std::filesystem::path& agentDir);
};

class PathUtils {
public:
    static std::filesystem::path GetHome();

    /** @brief $REFLECT_HOME if set, otherwise $HOME/.pi/agent. */
    static std::filesystem::path GetAgentDir();

    static ReflectPaths GetReflectPaths();

    /** @brief Expands a leading "~" to the home directory and makes relative paths absolute. */
    static std::string ResolvePath(const std::string& path);

    /**
     * @brief Turns a session directory name into a project label.
     *
     * "--Users-<user>-" and "--home-<user>-" prefixes are stripped, "--"
     * becomes "/", and leading or trailing dashes and slashes are removed.
     */
    static std::string ProjectNameFromDir(const std::string& dirname);
};

} // namespace reflect::infrastructure
