/**
 * @file SessionExchange.hpp
 * @brief Domain value objects for evidence extracted from agent session logs.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace reflect::domain {

/**
 * @enum ExchangeRole
 * @brief Who produced a turn in a session.
 */
enum class ExchangeRole {
    User,
    Agent
};

/**
 * @struct Exchange
 * @brief One turn of a session: the visible text and, for the agent, its reasoning trace.
 */
struct Exchange {
    ExchangeRole role = ExchangeRole::User;
    std::optional<std::string> text;      ///< Joined text fragments.
    std::optional<std::string> thinking;  ///< Joined reasoning fragments (agent only).
};

/**
 * @struct SessionRecord
 * @brief One scanned session that qualified for evidence, with its derived metrics.
 */
struct SessionRecord {
    int userTurnCount = 0;
    int totalTurnCount = 0;
    std::string formattedTranscript;
    std::size_t byteSize = 0;
    std::string originGroup; ///< Display name of the project directory.
    std::string timeLabel;   ///< "YYYY-MM-DD HH:MM:SS" taken from the file name.

    /** @brief User turns per turn; the packing priority. */
    double density() const {
        int total = totalTurnCount > 1 ? totalTurnCount : 1;
        return static_cast<double>(userTurnCount) / static_cast<double>(total);
    }
};

/**
 * @struct EvidenceBundle
 * @brief Evidence text handed to the reflection run, plus scan counters.
 *
 * sessionsIncluded never exceeds sessionsScanned. When the bundle came from
 * the session log scanner, sessions holds the included records in packing order
 * so that the run can split them into batches.
 */
struct EvidenceBundle {
    std::string text;
    int sessionsScanned = 0;
    int sessionsIncluded = 0;
    std::optional<std::vector<SessionRecord>> sessions;

    bool isEmpty() const { return text.empty() || sessionsIncluded == 0; }
};

} // namespace reflect::domain
