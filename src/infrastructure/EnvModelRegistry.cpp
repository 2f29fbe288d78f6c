#include "infrastructure/EnvModelRegistry.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace reflect::infrastructure {

namespace {

std::string EnvOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (value && *value) return value;
    return fallback;
}

} // namespace

std::vector<std::string> EnvModelRegistry::KnownProviders() {
    return {"anthropic", "ollama"};
}

std::string EnvModelRegistry::ApiKeyVariable(const std::string& provider) {
    std::string var;
    var.reserve(provider.size() + 8);
    for (char ch : provider) {
        unsigned char c = static_cast<unsigned char>(ch);
        var.push_back(std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_');
    }
    return var + "_API_KEY";
}

std::optional<domain::ModelHandle> EnvModelRegistry::findModel(const std::string& provider, const std::string& modelId) {
    if (modelId.empty()) return std::nullopt;

    auto known = KnownProviders();
    if (std::find(known.begin(), known.end(), provider) == known.end()) {
        return std::nullopt;
    }

    domain::ModelHandle handle;
    handle.provider = provider;
    handle.id = modelId;
    if (provider == "anthropic") {
        handle.baseUrl = EnvOr("ANTHROPIC_BASE_URL", "https://api.anthropic.com");
    } else {
        std::string host = EnvOr("OLLAMA_HOST", "http://localhost:11434");
        if (host.find("://") == std::string::npos) {
            host = "http://" + host;
        }
        handle.baseUrl = host;
    }
    return handle;
}

std::optional<std::string> EnvModelRegistry::getApiKey(const domain::ModelHandle& model) {
    if (model.provider == "ollama") {
        return std::string();
    }
    const char* key = std::getenv(ApiKeyVariable(model.provider).c_str());
    if (!key || !*key) {
        return std::nullopt;
    }
    return std::string(key);
}

} // namespace reflect::infrastructure
