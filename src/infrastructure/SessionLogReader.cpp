/**
 * @file SessionLogReader.cpp
 * @brief Implementation of SessionLogReader.
 */

#include "infrastructure/SessionLogReader.hpp"
#include "domain/TextUtils.hpp"
#include <nlohmann/json.hpp>

namespace reflect::infrastructure {

using json = nlohmann::json;

namespace {

std::optional<std::string> Join(const std::vector<std::string>& parts) {
    if (parts.empty()) return std::nullopt;
    std::string out = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
        out += "\n";
        out += parts[i];
    }
    return out;
}

// Returns the string field, or empty when absent or not a string.
std::string StringField(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

} // namespace

SessionLogReader::SessionLogReader(const std::string& filepath)
    : m_stream(filepath) {
    if (!m_stream.is_open()) {
        m_done = true;
    }
}

std::optional<domain::Exchange> SessionLogReader::ParseLine(const std::string& line) {
    json entry = json::parse(line, nullptr, false);
    if (entry.is_discarded() || !entry.is_object()) return std::nullopt;

    if (StringField(entry, "type") != "message") return std::nullopt;
    auto msgIt = entry.find("message");
    if (msgIt == entry.end() || !msgIt->is_object()) return std::nullopt;
    const json& msg = *msgIt;

    std::string role = StringField(msg, "role");
    if (role != "user" && role != "assistant") return std::nullopt;

    auto contentIt = msg.find("content");
    if (contentIt == msg.end() || !contentIt->is_array()) return std::nullopt;

    std::vector<std::string> textParts;
    std::vector<std::string> thinkingParts;
    for (const auto& part : *contentIt) {
        if (!part.is_object()) continue;
        std::string type = StringField(part, "type");
        if (type == "text") {
            std::string text = domain::Trim(StringField(part, "text"));
            if (!text.empty()) textParts.push_back(text);
        } else if (type == "thinking") {
            std::string thinking = domain::Trim(StringField(part, "thinking"));
            if (!thinking.empty()) thinkingParts.push_back(thinking);
        }
    }

    if (textParts.empty() && thinkingParts.empty()) return std::nullopt;

    domain::Exchange exchange;
    exchange.role = role == "user" ? domain::ExchangeRole::User : domain::ExchangeRole::Agent;
    exchange.text = Join(textParts);
    exchange.thinking = Join(thinkingParts);
    return exchange;
}

std::optional<domain::Exchange> SessionLogReader::next() {
    std::string line;
    while (!m_done) {
        if (!std::getline(m_stream, line)) {
            m_done = true;
            break;
        }
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        auto exchange = ParseLine(line);
        if (exchange) return exchange;
    }
    return std::nullopt;
}

std::vector<domain::Exchange> SessionLogReader::readAll() {
    std::vector<domain::Exchange> exchanges;
    while (auto exchange = next()) {
        exchanges.push_back(std::move(*exchange));
    }
    return exchanges;
}

std::vector<domain::Exchange> SessionLogReader::Extract(const std::string& filepath) {
    SessionLogReader reader(filepath);
    return reader.readAll();
}

} // namespace reflect::infrastructure
