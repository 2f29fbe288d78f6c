/**
 * @file LlmClient.hpp
 * @brief Low-level HTTP client for the Anthropic Messages API and the Ollama chat API.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "domain/AnalysisService.hpp"

namespace reflect::infrastructure {

/**
 * @struct ToolSpec
 * @brief A single tool offered to the model; its input schema is plain JSON Schema.
 */
struct ToolSpec {
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
};

class LlmClient {
public:
    /** @brief POST /v1/messages. A tool_use block named after the tool fills toolArguments. */
    domain::AnalysisResponse anthropicMessages(const domain::ModelHandle& model,
                                               const std::string& apiKey,
                                               const domain::AnalysisRequest& request,
                                               const ToolSpec& tool);

    /** @brief POST /api/chat with stream disabled. A tool call named after the tool fills toolArguments. */
    domain::AnalysisResponse ollamaChat(const domain::ModelHandle& model,
                                        const domain::AnalysisRequest& request,
                                        const ToolSpec& tool);

    /** @brief Extracts text and tool arguments from a Messages API body. */
    static domain::AnalysisResponse ParseAnthropicBody(const nlohmann::json& body, const std::string& toolName);

    /** @brief Extracts text and tool arguments from an Ollama chat body. */
    static domain::AnalysisResponse ParseOllamaBody(const nlohmann::json& body, const std::string& toolName);

private:
    static constexpr int kReadTimeoutSeconds = 600;
};

} // namespace reflect::infrastructure
