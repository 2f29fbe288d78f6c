/**
 * @file HistoryStore.hpp
 * @brief Append-only, size-capped history of reflection runs (reflect-history.json).
 */

#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>
#include "domain/ReflectionRun.hpp"

namespace reflect::infrastructure {

/**
 * @class HistoryStore
 * @brief Persists ReflectionRun records as a JSON array, keeping the most recent ones.
 */
class HistoryStore {
public:
    static constexpr std::size_t kMaxRuns = 100;

    explicit HistoryStore(std::string historyFile);

    /**
     * @brief All stored runs, oldest first. Missing or malformed file yields an empty list.
     *
     * Fields of the wrong type read as their defaults; the rest of the record is kept.
     */
    std::vector<domain::ReflectionRun> load() const;

    /** @brief Writes the last kMaxRuns runs. */
    bool save(const std::vector<domain::ReflectionRun>& runs) const;

    /** @brief Loads, appends and saves. Refuses to overwrite a history file that exists but cannot be parsed. */
    bool append(const domain::ReflectionRun& run) const;

    /**
     * @brief Sections edited in more than one run, with the number of runs that touched each.
     *
     * A section that keeps coming back means the rule is not sticking.
     */
    static std::map<std::string, int> RecurringSections(const std::vector<domain::ReflectionRun>& runs);

    static nlohmann::json RunToJson(const domain::ReflectionRun& run);
    static domain::ReflectionRun RunFromJson(const nlohmann::json& j);

private:
    /** @brief nullopt when the file exists but is not a readable JSON array. */
    std::optional<std::vector<domain::ReflectionRun>> tryLoad() const;

    std::string m_historyFile;
};

} // namespace reflect::infrastructure
