/**
 * @file EnvModelRegistry.hpp
 * @brief Model registry that reads endpoints and credentials from the environment.
 */

#pragma once
#include "domain/AnalysisService.hpp"
#include <string>
#include <vector>

namespace reflect::infrastructure {

/**
 * @class EnvModelRegistry
 * @brief Knows the anthropic and ollama providers.
 *
 * Credentials come from <PROVIDER>_API_KEY (ANTHROPIC_API_KEY for anthropic).
 * Ollama runs locally and needs none; OLLAMA_HOST overrides its endpoint.
 */
class EnvModelRegistry : public domain::ModelRegistry {
public:
    std::optional<domain::ModelHandle> findModel(const std::string& provider, const std::string& modelId) override;
    std::optional<std::string> getApiKey(const domain::ModelHandle& model) override;

    static std::vector<std::string> KnownProviders();
    static std::string ApiKeyVariable(const std::string& provider);
};

} // namespace reflect::infrastructure
