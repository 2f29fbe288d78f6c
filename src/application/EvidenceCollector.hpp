/**
 * @file EvidenceCollector.hpp
 * @brief Application service that scans session logs and packs the most useful ones into evidence.
 */

#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <cstddef>
#include "domain/SessionExchange.hpp"

namespace reflect::application {

/**
 * @class EvidenceCollector
 * @brief Turns a directory of per-project session logs into an EvidenceBundle.
 *
 * Each subdirectory of the sessions root is one project. Log files are named
 * "YYYY-MM-DDTHH-MM-SS...jsonl" and are in scope when their date is a target
 * date, or the following day before 08:00 (sessions logged in UTC that started
 * on the previous local evening).
 */
class EvidenceCollector {
public:
    static constexpr std::size_t kMaxThinkingChars = 1500;
    static constexpr std::size_t kMaxAgentChars = 2000;
    static constexpr int kMinUserTurns = 1;
    static constexpr int kMinTotalTurns = 3;
    static constexpr int kNextDayHourCutoff = 8;
    static constexpr const char* kEntrySeparator = "\n---\n\n";

    explicit EvidenceCollector(std::string sessionsDir);

    /** @brief Sessions from the lookbackDays days before today (UTC). */
    domain::EvidenceBundle collect(int lookbackDays, std::size_t maxBytes,
                                   std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    /** @brief Sessions from one specific date. */
    domain::EvidenceBundle collectForDate(const std::string& date, std::size_t maxBytes) const;

    /**
     * @brief Scans, ranks and packs the sessions of the given dates.
     *
     * Sessions are ordered by user-turn density (ties by user turns, stable)
     * and packed greedily: an entry that would overflow maxBytes is skipped and
     * packing continues with the next one.
     */
    domain::EvidenceBundle scan(const std::vector<std::string>& targetDates, std::size_t maxBytes) const;

    /** @brief Distinct, sorted dates that have at least one session log. */
    std::vector<std::string> availableDates() const;

    static std::string FormatSessionTranscript(const std::vector<domain::Exchange>& exchanges,
                                               const std::string& timeLabel,
                                               const std::string& project);

private:
    std::vector<std::string> projectDirs() const;

    std::string m_sessionsDir;
};

} // namespace reflect::application
