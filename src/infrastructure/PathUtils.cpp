#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace reflect::infrastructure {

namespace fs = std::filesystem;

ReflectPaths ReflectPaths::FromAgentDir(const fs::path& agentDir) {
    ReflectPaths paths;
    paths.configDir = agentDir;
    paths.configFile = agentDir / "reflect.json";
    paths.sessionsDir = agentDir / "sessions";
    paths.backupDir = agentDir / "reflect-backups";
    paths.historyFile = agentDir / "reflect-history.json";
    return paths;
}

fs::path PathUtils::GetHome() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home);
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetAgentDir() {
    const char* reflectHome = std::getenv("REFLECT_HOME");
    if (reflectHome && *reflectHome) {
        return fs::path(reflectHome);
    }
    return GetHome() / ".pi" / "agent";
}

ReflectPaths PathUtils::GetReflectPaths() {
    return ReflectPaths::FromAgentDir(GetAgentDir());
}

std::string PathUtils::ResolvePath(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        std::string rest = path.substr(1);
        while (!rest.empty() && (rest[0] == '/' || rest[0] == '\\')) rest.erase(0, 1);
        return (GetHome() / rest).lexically_normal().string();
    }
    return fs::absolute(fs::path(path)).lexically_normal().string();
}

std::string PathUtils::ProjectNameFromDir(const std::string& dirname) {
    std::string name = dirname;
    const char* userEnv = std::getenv("USER");
    std::string user = (userEnv && *userEnv) ? userEnv : "user";

    const std::string macPrefix = "--Users-" + user + "-";
    if (name.rfind(macPrefix, 0) == 0) {
        name = name.substr(macPrefix.size());
    }
    const std::string linuxPrefix = "--home-" + user + "-";
    if (name.rfind(linuxPrefix, 0) == 0) {
        name = name.substr(linuxPrefix.size());
    }

    std::string replaced;
    replaced.reserve(name.size());
    for (size_t i = 0; i < name.size(); ++i) {
        if (name[i] == '-' && i + 1 < name.size() && name[i + 1] == '-') {
            replaced.push_back('/');
            ++i;
        } else {
            replaced.push_back(name[i]);
        }
    }

    size_t start = replaced.find_first_not_of("-/");
    if (start == std::string::npos) return "workspace";
    size_t end = replaced.find_last_not_of("-/");
    return replaced.substr(start, end - start + 1);
}

} // namespace reflect::infrastructure
