/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving reflection targets (reflect.json).
 *
 * Each stored target is merged over the defaults, so partial entries are valid.
 */

#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "domain/ReflectTarget.hpp"
#include "infrastructure/PathUtils.hpp"

namespace reflect::infrastructure {

class ConfigLoader {
public:
    /** @brief Target with every default filled in; backups go under the agent directory. */
    static domain::ReflectTarget DefaultTarget(const ReflectPaths& paths);

    /**
     * @brief Reads reflect.json.
     * @return The configured targets; an empty config when the file is missing or malformed.
     */
    static domain::ReflectConfig Load(const ReflectPaths& paths);

    /** @brief Writes reflect.json (indent 2), creating the config directory. */
    static bool Save(const ReflectPaths& paths, const domain::ReflectConfig& config);

    /** @brief Finds a configured target whose resolved path equals the resolved argument. */
    static std::optional<domain::ReflectTarget> FindTarget(const domain::ReflectConfig& config, const std::string& path);

    static domain::ReflectTarget TargetFromJson(const nlohmann::json& j, const domain::ReflectTarget& defaults);
    static nlohmann::json TargetToJson(const domain::ReflectTarget& target);
    static domain::ContextSource ContextSourceFromJson(const nlohmann::json& j);
    static nlohmann::json ContextSourceToJson(const domain::ContextSource& source);
};

} // namespace reflect::infrastructure
