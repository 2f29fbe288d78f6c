/**
 * @file AnalysisService.hpp
 * @brief Capability interfaces for the external analysis model.
 */

#pragma once
#include <string>
#include <optional>

namespace reflect::domain {

/**
 * @struct ModelHandle
 * @brief A resolved model: provider, model id and the endpoint to reach it.
 */
struct ModelHandle {
    std::string provider; ///< e.g. "anthropic", "ollama".
    std::string id;       ///< e.g. "claude-sonnet-4-5".
    std::string baseUrl;  ///< Scheme, host and port of the provider API.
};

/**
 * @class ModelRegistry
 * @brief Resolves "provider/model" names and their credentials.
 */
class ModelRegistry {
public:
    virtual ~ModelRegistry() = default;

    /** @brief Returns the model if the provider is known, nullopt otherwise. */
    virtual std::optional<ModelHandle> findModel(const std::string& provider, const std::string& modelId) = 0;

    /**
     * @brief Looks up the API key for a model.
     * @return The key; an empty string for providers that need none; nullopt if a key is required but missing.
     */
    virtual std::optional<std::string> getApiKey(const ModelHandle& model) = 0;
};

/**
 * @struct AnalysisRequest
 * @brief One prompt for the analysis model.
 */
struct AnalysisRequest {
    std::string systemPrompt;
    std::string prompt;
    int maxTokens = 16384;
};

/**
 * @struct AnalysisResponse
 * @brief What the model returned.
 *
 * When ok is false, errorMessage explains the transport or provider failure.
 * toolArguments holds the raw JSON arguments of a structured tool invocation,
 * when the provider answered with one.
 */
struct AnalysisResponse {
    bool ok = false;
    std::string errorMessage;
    std::string text;
    std::optional<std::string> toolArguments;

    static AnalysisResponse Error(std::string message) {
        AnalysisResponse r;
        r.ok = false;
        r.errorMessage = std::move(message);
        return r;
    }
};

/**
 * @class AnalysisService
 * @brief Abstract interface for services that run a reflection prompt through a model.
 */
class AnalysisService {
public:
    virtual ~AnalysisService() = default;

    /**
     * @brief Sends the request to the model.
     * @param model Resolved model.
     * @param apiKey Credential for the provider (may be empty).
     * @param request Prompts.
     * @return The response; transport failures are reported through ok/errorMessage, never thrown.
     */
    virtual AnalysisResponse analyze(const ModelHandle& model,
                                     const std::string& apiKey,
                                     const AnalysisRequest& request) = 0;
};

} // namespace reflect::domain
