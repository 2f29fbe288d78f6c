/**
 * @file EvidenceCollector.cpp
 * @brief Implementation of the EvidenceCollector service.
 */

#include "application/EvidenceCollector.hpp"
#include "domain/TextUtils.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/SessionLogReader.hpp"
#include "infrastructure/TimeUtils.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace reflect::application {

namespace {

bool EndsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Hour field of "YYYY-MM-DDTHH..."; -1 when it is not numeric.
int FileHour(const std::string& file) {
    if (file.size() < 13) return -1;
    char a = file[11];
    char b = file[12];
    if (!std::isdigit(static_cast<unsigned char>(a)) || !std::isdigit(static_cast<unsigned char>(b))) return -1;
    return (a - '0') * 10 + (b - '0');
}

} // namespace

EvidenceCollector::EvidenceCollector(std::string sessionsDir)
    : m_sessionsDir(std::move(sessionsDir)) {}

std::vector<std::string> EvidenceCollector::projectDirs() const {
    std::vector<std::string> dirs;
    std::error_code ec;
    if (!fs::is_directory(m_sessionsDir, ec)) {
        return dirs;
    }
    for (const auto& entry : fs::directory_iterator(m_sessionsDir, ec)) {
        std::string name = entry.path().filename().string();
        if (name.find("var-folders") != std::string::npos) continue;
        std::error_code typeEc;
        if (entry.is_directory(typeEc)) {
            dirs.push_back(entry.path().string());
        }
    }
    if (ec) {
        std::cerr << "[EvidenceCollector] Cannot list " << m_sessionsDir << ": " << ec.message() << std::endl;
    }
    std::sort(dirs.begin(), dirs.end());
    return dirs;
}

std::string EvidenceCollector::FormatSessionTranscript(const std::vector<domain::Exchange>& exchanges,
                                                       const std::string& timeLabel,
                                                       const std::string& project) {
    std::ostringstream ss;
    ss << "### Session: " << project << " [" << timeLabel << "]\n";
    for (const auto& ex : exchanges) {
        if (ex.role == domain::ExchangeRole::User) {
            ss << "\n**USER:** " << ex.text.value_or("") << "\n";
        } else {
            if (ex.thinking) {
                ss << "\n**THINKING:** " << domain::TruncateText(*ex.thinking, kMaxThinkingChars) << "\n";
            }
            if (ex.text) {
                ss << "\n**AGENT:** " << domain::TruncateText(*ex.text, kMaxAgentChars) << "\n";
            }
        }
    }
    return ss.str();
}

domain::EvidenceBundle EvidenceCollector::scan(const std::vector<std::string>& targetDates, std::size_t maxBytes) const {
    domain::EvidenceBundle bundle;

    std::set<std::string> targetSet(targetDates.begin(), targetDates.end());
    std::set<std::string> nextDaySet;
    for (const auto& date : targetDates) {
        if (auto next = infrastructure::TimeUtils::NextDay(date)) {
            nextDaySet.insert(*next);
        }
    }

    std::vector<domain::SessionRecord> candidates;
    int scanned = 0;

    for (const auto& dir : projectDirs()) {
        std::string project = infrastructure::PathUtils::ProjectNameFromDir(fs::path(dir).filename().string());

        std::vector<std::string> files;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            std::string name = entry.path().filename().string();
            if (EndsWith(name, ".jsonl")) {
                files.push_back(name);
            }
        }
        if (ec) {
            std::cerr << "[EvidenceCollector] Skipping " << dir << ": " << ec.message() << std::endl;
            continue;
        }
        std::sort(files.begin(), files.end());

        for (const auto& file : files) {
            std::string fileDate = file.substr(0, 10);
            if (!targetSet.count(fileDate)) {
                if (!nextDaySet.count(fileDate)) continue;
                int hour = FileHour(file);
                if (hour < 0 || hour >= kNextDayHourCutoff) continue;
            }

            ++scanned;
            auto exchanges = infrastructure::SessionLogReader::Extract((fs::path(dir) / file).string());
            int userTurns = static_cast<int>(std::count_if(exchanges.begin(), exchanges.end(),
                [](const domain::Exchange& ex) { return ex.role == domain::ExchangeRole::User; }));
            int totalTurns = static_cast<int>(exchanges.size());
            if (userTurns < kMinUserTurns || totalTurns < kMinTotalTurns) continue;

            std::string timeLabel = file.substr(0, 19);
            std::replace(timeLabel.begin(), timeLabel.end(), 'T', ' ');

            domain::SessionRecord record;
            record.userTurnCount = userTurns;
            record.totalTurnCount = totalTurns;
            record.formattedTranscript = FormatSessionTranscript(exchanges, timeLabel, project);
            record.byteSize = record.formattedTranscript.size();
            record.originGroup = project;
            record.timeLabel = timeLabel;
            candidates.push_back(std::move(record));
        }
    }

    bundle.sessionsScanned = scanned;
    if (candidates.empty()) {
        return bundle;
    }

    std::stable_sort(candidates.begin(), candidates.end(),
        [](const domain::SessionRecord& a, const domain::SessionRecord& b) {
            if (a.density() != b.density()) return a.density() > b.density();
            return a.userTurnCount > b.userTurnCount;
        });

    const std::string separator = kEntrySeparator;
    std::vector<domain::SessionRecord> included;
    std::string body;
    int totalUserTurns = 0;
    for (auto& record : candidates) {
        totalUserTurns += record.userTurnCount;
        std::size_t entrySize = record.byteSize + separator.size();
        if (body.size() + entrySize > maxBytes) continue;
        body += record.formattedTranscript;
        body += separator;
        included.push_back(record);
    }

    std::ostringstream header;
    header << "# Session Transcripts\n"
           << "# Sessions scanned: " << scanned << ", " << candidates.size()
           << " with substantive conversation, " << included.size() << " included\n"
           << "# Total user messages: " << totalUserTurns << "\n\n";

    bundle.text = header.str() + body;
    bundle.sessionsIncluded = static_cast<int>(included.size());
    bundle.sessions = std::move(included);
    return bundle;
}

domain::EvidenceBundle EvidenceCollector::collect(int lookbackDays, std::size_t maxBytes,
                                                  std::chrono::system_clock::time_point now) const {
    std::vector<std::string> dates;
    for (int i = 1; i <= lookbackDays; ++i) {
        dates.push_back(infrastructure::TimeUtils::DateDaysAgo(i, now));
    }
    return scan(dates, maxBytes);
}

domain::EvidenceBundle EvidenceCollector::collectForDate(const std::string& date, std::size_t maxBytes) const {
    return scan({date}, maxBytes);
}

std::vector<std::string> EvidenceCollector::availableDates() const {
    std::set<std::string> dates;
    for (const auto& dir : projectDirs()) {
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            std::string name = entry.path().filename().string();
            if (!EndsWith(name, ".jsonl")) continue;
            std::string fileDate = name.substr(0, 10);
            if (infrastructure::TimeUtils::IsDate(fileDate)) {
                dates.insert(fileDate);
            }
        }
    }
    return std::vector<std::string>(dates.begin(), dates.end());
}

} // namespace reflect::application
