/**
 * @file HistoryStore.cpp
 * @brief Implementation of HistoryStore.
 */

#include "infrastructure/HistoryStore.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <set>

namespace reflect::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

std::string StringField(const json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && it->is_string() ? it->get<std::string>() : std::string();
}

double NumberField(const json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && it->is_number() ? it->get<double>() : 0.0;
}

int IntField(const json& j, const char* key) {
    double value = NumberField(j, key);
    if (std::isnan(value)) return 0;
    value = std::clamp<double>(value, std::numeric_limits<int>::min(), std::numeric_limits<int>::max());
    return static_cast<int>(std::lround(value));
}

} // namespace

HistoryStore::HistoryStore(std::string historyFile)
    : m_historyFile(std::move(historyFile)) {}

json HistoryStore::RunToJson(const domain::ReflectionRun& run) {
    json j;
    j["timestamp"] = run.timestamp;
    j["targetPath"] = run.targetPath;
    j["sessionsAnalyzed"] = run.sessionsAnalyzed;
    j["correctionsFound"] = run.correctionsFound;
    j["editsApplied"] = run.editsApplied;
    j["summary"] = run.summary;
    j["diffLines"] = run.diffLines;
    j["correctionRate"] = run.correctionRate;
    j["edits"] = json::array();
    for (const auto& e : run.edits) {
        j["edits"].push_back({
            {"type", domain::EditKindToString(e.kind)},
            {"section", e.section},
            {"reason", e.reason}
        });
    }
    if (!run.sourceDate.empty()) {
        j["sourceDate"] = run.sourceDate;
    }
    return j;
}

domain::ReflectionRun HistoryStore::RunFromJson(const json& j) {
    domain::ReflectionRun run;
    if (!j.is_object()) return run;
    run.timestamp = StringField(j, "timestamp");
    run.targetPath = StringField(j, "targetPath");
    run.sessionsAnalyzed = IntField(j, "sessionsAnalyzed");
    run.correctionsFound = IntField(j, "correctionsFound");
    run.editsApplied = IntField(j, "editsApplied");
    run.summary = StringField(j, "summary");
    run.diffLines = IntField(j, "diffLines");
    run.correctionRate = NumberField(j, "correctionRate");
    // Older batch runs stored only "date".
    run.sourceDate = StringField(j, "sourceDate");
    if (run.sourceDate.empty()) run.sourceDate = StringField(j, "date");
    if (j.contains("edits") && j["edits"].is_array()) {
        for (const auto& e : j["edits"]) {
            if (!e.is_object()) continue;
            domain::EditRecord record;
            std::string type = StringField(e, "type");
            record.kind = domain::EditKindFromString(type.empty() ? "add" : type);
            if (record.kind == domain::EditKind::Unknown) record.kind = domain::EditKind::Insert;
            record.section = StringField(e, "section");
            record.reason = StringField(e, "reason");
            run.edits.push_back(record);
        }
    }
    return run;
}

std::optional<std::vector<domain::ReflectionRun>> HistoryStore::tryLoad() const {
    std::vector<domain::ReflectionRun> runs;
    if (!fs::exists(m_historyFile)) return runs;

    json j;
    try {
        std::ifstream f(m_historyFile);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[HistoryStore] Error reading history: " << e.what() << std::endl;
        return std::nullopt;
    }
    if (!j.is_array()) {
        std::cerr << "[HistoryStore] History file is not a JSON array: " << m_historyFile << std::endl;
        return std::nullopt;
    }
    for (const auto& item : j) {
        if (item.is_object()) runs.push_back(RunFromJson(item));
    }
    return runs;
}

std::vector<domain::ReflectionRun> HistoryStore::load() const {
    return tryLoad().value_or(std::vector<domain::ReflectionRun>());
}

bool HistoryStore::save(const std::vector<domain::ReflectionRun>& runs) const {
    size_t start = runs.size() > kMaxRuns ? runs.size() - kMaxRuns : 0;
    json j = json::array();
    for (size_t i = start; i < runs.size(); ++i) {
        j.push_back(RunToJson(runs[i]));
    }

    try {
        fs::path p(m_historyFile);
        if (p.has_parent_path()) fs::create_directories(p.parent_path());
        std::ofstream f(m_historyFile);
        f << j.dump(2);
        return static_cast<bool>(f);
    } catch (const std::exception& e) {
        std::cerr << "[HistoryStore] Error writing history: " << e.what() << std::endl;
    }
    return false;
}

bool HistoryStore::append(const domain::ReflectionRun& run) const {
    auto runs = tryLoad();
    if (!runs) {
        std::cerr << "[HistoryStore] Not overwriting unreadable history: " << m_historyFile << std::endl;
        return false;
    }
    runs->push_back(run);
    return save(*runs);
}

std::map<std::string, int> HistoryStore::RecurringSections(const std::vector<domain::ReflectionRun>& runs) {
    std::map<std::string, int> perSection;
    for (const auto& run : runs) {
        std::set<std::string> touched;
        for (const auto& e : run.edits) {
            if (!e.section.empty()) touched.insert(e.section);
        }
        for (const auto& section : touched) {
            perSection[section]++;
        }
    }

    std::map<std::string, int> recurring;
    for (const auto& [section, count] : perSection) {
        if (count > 1) recurring[section] = count;
    }
    return recurring;
}

} // namespace reflect::infrastructure
