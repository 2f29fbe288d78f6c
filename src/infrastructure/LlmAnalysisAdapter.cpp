#include "infrastructure/LlmAnalysisAdapter.hpp"
#include <iostream>

namespace reflect::infrastructure {

using json = nlohmann::json;

ToolSpec LlmAnalysisAdapter::AnalysisTool() {
    json edit = {
        {"type", "object"},
        {"properties", {
            {"type", {{"type", "string"}, {"enum", json::array({"strengthen", "add"})},
                      {"description", "strengthen rewrites an existing rule, add inserts a new one"}}},
            {"old_text", {{"type", "string"}, {"description", "Exact text to replace (strengthen only)"}}},
            {"after_text", {{"type", "string"}, {"description", "Exact text to insert after (add only)"}}},
            {"new_text", {{"type", "string"}, {"description", "Replacement or inserted text"}}},
            {"section", {{"type", "string"}}},
            {"reason", {{"type", "string"}}}
        }},
        {"required", json::array({"type", "new_text"})}
    };

    ToolSpec tool;
    tool.name = kToolName;
    tool.description = "Submit the reflection analysis: corrections found and the edits to apply to the target file.";
    tool.inputSchema = {
        {"type", "object"},
        {"properties", {
            {"corrections_found", {{"type", "integer"}}},
            {"sessions_with_corrections", {{"type", "integer"}}},
            {"edits", {{"type", "array"}, {"items", edit}}},
            {"patterns_not_added", {{"type", "array"}, {"items", {
                {"type", "object"},
                {"properties", {{"pattern", {{"type", "string"}}}, {"reason", {{"type", "string"}}}}}
            }}}},
            {"summary", {{"type", "string"}}}
        }},
        {"required", json::array({"corrections_found", "edits", "summary"})}
    };
    return tool;
}

domain::AnalysisResponse LlmAnalysisAdapter::analyze(const domain::ModelHandle& model,
                                                     const std::string& apiKey,
                                                     const domain::AnalysisRequest& request) {
    if (model.provider == "anthropic") {
        return m_client.anthropicMessages(model, apiKey, request, AnalysisTool());
    }
    if (model.provider == "ollama") {
        return m_client.ollamaChat(model, request, AnalysisTool());
    }
    std::cerr << "[LlmAnalysisAdapter] Unsupported provider: " << model.provider << std::endl;
    return domain::AnalysisResponse::Error("Unsupported provider: " + model.provider);
}

} // namespace reflect::infrastructure
