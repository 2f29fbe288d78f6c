/**
 * @file AnalysisParser.hpp
 * @brief Turns the analysis model's answer into corrections, edits and a summary.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "domain/AnalysisService.hpp"
#include "domain/ProposedEdit.hpp"

namespace reflect::application {

struct SkippedPattern {
    std::string pattern;
    std::string reason;
};

/**
 * @struct AnalysisResult
 * @brief Parsed analysis document.
 */
struct AnalysisResult {
    int correctionsFound = 0;
    int sessionsWithCorrections = 0;
    std::vector<domain::ProposedEdit> edits;
    std::vector<SkippedPattern> patternsNotAdded;
    std::optional<std::string> summary;
};

class AnalysisParser {
public:
    /**
     * @brief Parses a response, preferring the tool invocation over the free text.
     * @return nullopt when neither carries a JSON object.
     */
    static std::optional<AnalysisResult> Parse(const domain::AnalysisResponse& response);

    /** @brief Parses free text: an optional ```json fence around one JSON object. */
    static std::optional<AnalysisResult> ParseText(const std::string& text);

    /** @brief Removes a leading ``` / ```json line and a trailing ``` fence. */
    static std::string StripCodeFence(const std::string& text);

    static AnalysisResult FromJson(const nlohmann::json& j);
    static domain::ProposedEdit EditFromJson(const nlohmann::json& j);
};

} // namespace reflect::application
