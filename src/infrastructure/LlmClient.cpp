#include "infrastructure/LlmClient.hpp"
#include <httplib.h>
#include <iostream>

namespace reflect::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kDeterministicTemperature = 0.0;
constexpr const char* kAnthropicVersion = "2023-06-01";

std::string ErrorFromBody(int status, const std::string& body) {
    json parsed = json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        if (parsed.contains("error")) {
            const auto& err = parsed["error"];
            if (err.is_object() && err.contains("message") && err["message"].is_string()) {
                return err["message"].get<std::string>();
            }
            if (err.is_string()) {
                return err.get<std::string>();
            }
        }
    }
    return "HTTP " + std::to_string(status) + ": " + body.substr(0, 200);
}
}

domain::AnalysisResponse LlmClient::ParseAnthropicBody(const json& body, const std::string& toolName) {
    domain::AnalysisResponse response;
    if (!body.is_object()) {
        return domain::AnalysisResponse::Error("response is not a JSON object");
    }
    if (body.value("type", std::string()) == "error") {
        std::string message = "provider error";
        if (body.contains("error") && body["error"].is_object()) {
            message = body["error"].value("message", message);
        }
        return domain::AnalysisResponse::Error(message);
    }
    if (!body.contains("content") || !body["content"].is_array()) {
        return domain::AnalysisResponse::Error("response has no content");
    }

    response.ok = true;
    for (const auto& block : body["content"]) {
        if (!block.is_object()) continue;
        std::string type = block.value("type", std::string());
        if (type == "text") {
            response.text += block.value("text", std::string());
        } else if (type == "tool_use" && block.value("name", std::string()) == toolName && block.contains("input")) {
            if (!response.toolArguments) {
                response.toolArguments = block["input"].dump();
            }
        }
    }
    return response;
}

domain::AnalysisResponse LlmClient::ParseOllamaBody(const json& body, const std::string& toolName) {
    if (!body.is_object()) {
        return domain::AnalysisResponse::Error("response is not a JSON object");
    }
    if (body.contains("error")) {
        return domain::AnalysisResponse::Error(body["error"].is_string() ? body["error"].get<std::string>() : body["error"].dump());
    }
    if (!body.contains("message") || !body["message"].is_object()) {
        return domain::AnalysisResponse::Error("response has no message");
    }

    domain::AnalysisResponse response;
    response.ok = true;
    const auto& message = body["message"];
    if (message.contains("content") && message["content"].is_string()) {
        response.text = message["content"].get<std::string>();
    }

    if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
        for (const auto& call : message["tool_calls"]) {
            if (!call.is_object() || !call.contains("function") || !call["function"].is_object()) continue;
            const auto& fn = call["function"];
            if (fn.value("name", std::string()) != toolName || !fn.contains("arguments")) continue;
            const auto& args = fn["arguments"];
            // Some models send the arguments as an encoded string.
            response.toolArguments = args.is_string() ? args.get<std::string>() : args.dump();
            break;
        }
    }
    return response;
}

domain::AnalysisResponse LlmClient::anthropicMessages(const domain::ModelHandle& model,
                                                      const std::string& apiKey,
                                                      const domain::AnalysisRequest& request,
                                                      const ToolSpec& tool) {
    httplib::Client cli(model.baseUrl);
    cli.set_read_timeout(kReadTimeoutSeconds);

    json requestData = {
        {"model", model.id},
        {"max_tokens", request.maxTokens},
        {"system", request.systemPrompt},
        {"temperature", kDeterministicTemperature},
        {"messages", json::array({
            {{"role", "user"}, {"content", request.prompt}}
        })},
        {"tools", json::array({
            {{"name", tool.name}, {"description", tool.description}, {"input_schema", tool.inputSchema}}
        })}
    };

    httplib::Headers headers = {
        {"x-api-key", apiKey},
        {"anthropic-version", kAnthropicVersion}
    };

    auto res = cli.Post("/v1/messages", headers, requestData.dump(), "application/json");
    if (!res) {
        std::string err = httplib::to_string(res.error());
        std::cerr << "[LlmClient] Connection failed: " << err << std::endl;
        return domain::AnalysisResponse::Error("Connection failed: " + err);
    }
    if (res->status != 200) {
        std::cerr << "[LlmClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        return domain::AnalysisResponse::Error(ErrorFromBody(res->status, res->body));
    }

    try {
        return ParseAnthropicBody(json::parse(res->body), tool.name);
    } catch (const std::exception& e) {
        std::cerr << "[LlmClient] JSON Parse Error: " << e.what() << std::endl;
        return domain::AnalysisResponse::Error(std::string("Malformed provider response: ") + e.what());
    }
}

domain::AnalysisResponse LlmClient::ollamaChat(const domain::ModelHandle& model,
                                               const domain::AnalysisRequest& request,
                                               const ToolSpec& tool) {
    httplib::Client cli(model.baseUrl);
    cli.set_read_timeout(kReadTimeoutSeconds);

    json requestData = {
        {"model", model.id},
        {"stream", false},
        {"messages", json::array({
            {{"role", "system"}, {"content", request.systemPrompt}},
            {{"role", "user"}, {"content", request.prompt}}
        })},
        {"tools", json::array({
            {{"type", "function"}, {"function", {
                {"name", tool.name},
                {"description", tool.description},
                {"parameters", tool.inputSchema}
            }}}
        })},
        {"options", {
            {"temperature", kDeterministicTemperature},
            {"num_predict", request.maxTokens}
        }}
    };

    auto res = cli.Post("/api/chat", requestData.dump(), "application/json");
    if (!res) {
        std::string err = httplib::to_string(res.error());
        std::cerr << "[LlmClient] Connection failed: " << err << std::endl;
        return domain::AnalysisResponse::Error("Connection failed: " + err);
    }
    if (res->status != 200) {
        std::cerr << "[LlmClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        return domain::AnalysisResponse::Error(ErrorFromBody(res->status, res->body));
    }

    try {
        return ParseOllamaBody(json::parse(res->body), tool.name);
    } catch (const std::exception& e) {
        std::cerr << "[LlmClient] Chat JSON Parse Error: " << e.what() << std::endl;
        return domain::AnalysisResponse::Error(std::string("Malformed provider response: ") + e.what());
    }
}

} // namespace reflect::infrastructure
