/**
 * @file ReflectionRun.hpp
 * @brief Persisted record of one reflection pass.
 */

#pragma once
#include <string>
#include <vector>
#include "ProposedEdit.hpp"

namespace reflect::domain {

/**
 * @struct EditRecord
 * @brief Kind, section and reason of one proposed edit, kept for recurrence reporting.
 */
struct EditRecord {
    EditKind kind = EditKind::Insert;
    std::string section;
    std::string reason;
};

/**
 * @struct ReflectionRun
 * @brief History entry written after a completed run. Never mutated once stored.
 */
struct ReflectionRun {
    std::string timestamp;   ///< ISO-8601 UTC.
    std::string targetPath;
    int sessionsAnalyzed = 0;
    int correctionsFound = 0;
    int editsApplied = 0;
    std::string summary;
    int diffLines = 0;
    double correctionRate = 0.0;
    std::vector<EditRecord> edits;
    std::string sourceDate;  ///< Date of the analyzed sessions, YYYY-MM-DD.
};

} // namespace reflect::domain
