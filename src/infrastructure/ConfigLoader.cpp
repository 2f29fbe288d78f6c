/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <limits>
#include <fstream>
#include <iostream>

namespace reflect::infrastructure {

using json = nlohmann::json;

namespace {

std::optional<std::string> OptionalString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

/** Whole numbers >= 1, capped at limit. Anything else is treated as absent. */
std::optional<long long> PositiveNumber(const json& j, const char* key, long long limit) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return std::nullopt;
    double value = it->get<double>();
    if (!(value >= 1.0)) return std::nullopt;
    if (value >= static_cast<double>(limit)) return limit;
    return static_cast<long long>(value);
}

std::vector<domain::ContextSource> SourcesFromJson(const json& j, const char* key) {
    std::vector<domain::ContextSource> sources;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) return sources;
    for (const auto& item : *it) {
        if (item.is_object()) {
            sources.push_back(ConfigLoader::ContextSourceFromJson(item));
        }
    }
    return sources;
}

const char* ContextTypeName(domain::ContextSourceType type) {
    switch (type) {
        case domain::ContextSourceType::Files: return "files";
        case domain::ContextSourceType::Command: return "command";
        case domain::ContextSourceType::Url: return "url";
    }
    return "files";
}

} // namespace

domain::ReflectTarget ConfigLoader::DefaultTarget(const ReflectPaths& paths) {
    domain::ReflectTarget target;
    target.backupDir = paths.backupDir.string();
    return target;
}

domain::ContextSource ConfigLoader::ContextSourceFromJson(const json& j) {
    domain::ContextSource source;
    std::string type = OptionalString(j, "type").value_or("files");
    if (type == "command") {
        source.type = domain::ContextSourceType::Command;
    } else if (type == "url") {
        source.type = domain::ContextSourceType::Url;
    } else {
        source.type = domain::ContextSourceType::Files;
    }
    source.label = OptionalString(j, "label");
    source.command = OptionalString(j, "command");
    source.url = OptionalString(j, "url");
    if (j.contains("paths") && j["paths"].is_array()) {
        for (const auto& p : j["paths"]) {
            if (p.is_string()) source.paths.push_back(p.get<std::string>());
        }
    }
    if (auto maxBytes = PositiveNumber(j, "maxBytes", std::numeric_limits<long long>::max())) {
        source.maxBytes = static_cast<std::size_t>(*maxBytes);
    }
    return source;
}

json ConfigLoader::ContextSourceToJson(const domain::ContextSource& source) {
    json j;
    j["type"] = ContextTypeName(source.type);
    if (source.label) j["label"] = *source.label;
    if (!source.paths.empty()) j["paths"] = source.paths;
    if (source.command) j["command"] = *source.command;
    if (source.url) j["url"] = *source.url;
    if (source.maxBytes) j["maxBytes"] = *source.maxBytes;
    return j;
}

domain::ReflectTarget ConfigLoader::TargetFromJson(const json& j, const domain::ReflectTarget& defaults) {
    domain::ReflectTarget target = defaults;
    // A field of the wrong type keeps its default; the rest of the target still loads.
    target.path = OptionalString(j, "path").value_or(defaults.path);
    target.schedule = OptionalString(j, "schedule").value_or(defaults.schedule);
    target.model = OptionalString(j, "model").value_or(defaults.model);
    target.lookbackDays = static_cast<int>(
        PositiveNumber(j, "lookbackDays", std::numeric_limits<int>::max()).value_or(defaults.lookbackDays));
    target.maxSessionBytes = static_cast<std::size_t>(
        PositiveNumber(j, "maxSessionBytes", std::numeric_limits<long long>::max()).value_or(defaults.maxSessionBytes));
    target.backupDir = OptionalString(j, "backupDir").value_or(defaults.backupDir);

    if (j.contains("transcriptSource") && j["transcriptSource"].is_object()) {
        const auto& ts = j["transcriptSource"];
        if (OptionalString(ts, "type").value_or("pi-sessions") == "command") {
            target.transcriptSource.type = domain::TranscriptSourceType::Command;
        } else {
            target.transcriptSource.type = domain::TranscriptSourceType::SessionLogs;
        }
        target.transcriptSource.command = OptionalString(ts, "command");
    }

    target.transcripts = SourcesFromJson(j, "transcripts");
    target.context = SourcesFromJson(j, "context");
    target.prompt = OptionalString(j, "prompt");
    return target;
}

json ConfigLoader::TargetToJson(const domain::ReflectTarget& target) {
    json j;
    j["path"] = target.path;
    j["schedule"] = target.schedule;
    j["model"] = target.model;
    j["lookbackDays"] = target.lookbackDays;
    j["maxSessionBytes"] = target.maxSessionBytes;
    j["backupDir"] = target.backupDir;

    json ts;
    ts["type"] = target.transcriptSource.type == domain::TranscriptSourceType::Command ? "command" : "pi-sessions";
    if (target.transcriptSource.command) ts["command"] = *target.transcriptSource.command;
    j["transcriptSource"] = ts;

    if (!target.transcripts.empty()) {
        j["transcripts"] = json::array();
        for (const auto& s : target.transcripts) j["transcripts"].push_back(ContextSourceToJson(s));
    }
    if (!target.context.empty()) {
        j["context"] = json::array();
        for (const auto& s : target.context) j["context"].push_back(ContextSourceToJson(s));
    }
    if (target.prompt) j["prompt"] = *target.prompt;
    return j;
}

domain::ReflectConfig ConfigLoader::Load(const ReflectPaths& paths) {
    domain::ReflectConfig config;
    if (!std::filesystem::exists(paths.configFile)) {
        return config;
    }

    try {
        std::ifstream f(paths.configFile);
        json j;
        f >> j;

        domain::ReflectTarget defaults = DefaultTarget(paths);
        if (j.contains("targets") && j["targets"].is_array()) {
            for (const auto& item : j["targets"]) {
                if (item.is_object()) {
                    config.targets.push_back(TargetFromJson(item, defaults));
                }
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading reflect.json: " << e.what() << std::endl;
        config.targets.clear();
    }

    return config;
}

bool ConfigLoader::Save(const ReflectPaths& paths, const domain::ReflectConfig& config) {
    json j;
    j["targets"] = json::array();
    for (const auto& target : config.targets) {
        j["targets"].push_back(TargetToJson(target));
    }

    try {
        std::filesystem::create_directories(paths.configDir);
        std::ofstream f(paths.configFile);
        f << j.dump(2);
        return static_cast<bool>(f);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing reflect.json: " << e.what() << std::endl;
    }
    return false;
}

std::optional<domain::ReflectTarget> ConfigLoader::FindTarget(const domain::ReflectConfig& config, const std::string& path) {
    std::string wanted = PathUtils::ResolvePath(path);
    for (const auto& target : config.targets) {
        if (PathUtils::ResolvePath(target.path) == wanted) {
            return target;
        }
    }
    return std::nullopt;
}

} // namespace reflect::infrastructure
