/**
 * @file LlmAnalysisAdapter.hpp
 * @brief AnalysisService backed by a remote or local language model.
 */

#pragma once
#include "domain/AnalysisService.hpp"
#include "infrastructure/LlmClient.hpp"

namespace reflect::infrastructure {

/**
 * @class LlmAnalysisAdapter
 * @brief Implements AnalysisService over LlmClient, dispatching on the model's provider.
 *
 * Every request offers the model a single tool, submit_analysis, whose input
 * schema mirrors the analysis document the application layer parses.
 */
class LlmAnalysisAdapter : public domain::AnalysisService {
public:
    static constexpr const char* kToolName = "submit_analysis";

    domain::AnalysisResponse analyze(const domain::ModelHandle& model,
                                     const std::string& apiKey,
                                     const domain::AnalysisRequest& request) override;

    /** @brief The submit_analysis tool definition. */
    static ToolSpec AnalysisTool();

private:
    LlmClient m_client;
};

} // namespace reflect::infrastructure
