/**
 * @file AnalysisParser.cpp
 * @brief Implementation of AnalysisParser.
 */

#include "application/AnalysisParser.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <iostream>

namespace reflect::application {

using json = nlohmann::json;

namespace {

std::optional<std::string> OptionalString(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) return std::nullopt;
    std::string value = j[key].get<std::string>();
    if (value.empty()) return std::nullopt;
    return value;
}

int IntField(const json& j, const char* key) {
    if (!j.contains(key)) return 0;
    const auto& v = j[key];
    constexpr auto kMin = std::numeric_limits<int>::min();
    constexpr auto kMax = std::numeric_limits<int>::max();
    if (v.is_number_unsigned()) {
        return static_cast<int>(std::min<std::uint64_t>(v.get<std::uint64_t>(), kMax));
    }
    if (v.is_number_integer()) {
        return static_cast<int>(std::clamp<std::int64_t>(v.get<std::int64_t>(), kMin, kMax));
    }
    if (v.is_number()) {
        double d = v.get<double>();
        if (std::isnan(d)) return 0;
        return static_cast<int>(std::lround(std::clamp<double>(d, kMin, kMax)));
    }
    return 0;
}

std::optional<json> ParseObject(const std::string& text) {
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;
    return parsed;
}

} // namespace

std::string AnalysisParser::StripCodeFence(const std::string& text) {
    std::string out = domain::Trim(text);
    if (domain::StartsWith(out, "```")) {
        size_t newline = out.find('\n');
        out = newline == std::string::npos ? std::string() : out.substr(newline + 1);
    }
    std::string trimmed = domain::Trim(out);
    if (trimmed.size() >= 3 && trimmed.compare(trimmed.size() - 3, 3, "```") == 0) {
        trimmed.erase(trimmed.size() - 3);
    }
    return domain::Trim(trimmed);
}

domain::ProposedEdit AnalysisParser::EditFromJson(const json& j) {
    domain::ProposedEdit edit;
    if (!j.is_object()) return edit;
    if (auto type = OptionalString(j, "type")) {
        edit.kind = domain::EditKindFromString(*type);
    }
    edit.anchorText = OptionalString(j, "old_text");
    edit.insertAfterText = OptionalString(j, "after_text");
    edit.newText = OptionalString(j, "new_text").value_or("");
    edit.section = OptionalString(j, "section");
    edit.reason = OptionalString(j, "reason");
    return edit;
}

AnalysisResult AnalysisParser::FromJson(const json& j) {
    AnalysisResult result;
    result.correctionsFound = IntField(j, "corrections_found");
    result.sessionsWithCorrections = IntField(j, "sessions_with_corrections");

    if (j.contains("edits") && j["edits"].is_array()) {
        for (const auto& item : j["edits"]) {
            result.edits.push_back(EditFromJson(item));
        }
    }

    if (j.contains("patterns_not_added") && j["patterns_not_added"].is_array()) {
        for (const auto& item : j["patterns_not_added"]) {
            if (!item.is_object()) continue;
            SkippedPattern skipped;
            skipped.pattern = OptionalString(item, "pattern").value_or("");
            skipped.reason = OptionalString(item, "reason").value_or("");
            result.patternsNotAdded.push_back(std::move(skipped));
        }
    }

    result.summary = OptionalString(j, "summary");
    return result;
}

std::optional<AnalysisResult> AnalysisParser::ParseText(const std::string& text) {
    std::string body = StripCodeFence(text);
    if (auto parsed = ParseObject(body)) {
        return FromJson(*parsed);
    }

    // Prose around the object: fall back to the outermost braces.
    size_t open = body.find('{');
    size_t close = body.rfind('}');
    if (open != std::string::npos && close != std::string::npos && close > open) {
        if (auto parsed = ParseObject(body.substr(open, close - open + 1))) {
            return FromJson(*parsed);
        }
    }
    return std::nullopt;
}

std::optional<AnalysisResult> AnalysisParser::Parse(const domain::AnalysisResponse& response) {
    if (response.toolArguments) {
        if (auto parsed = ParseObject(*response.toolArguments)) {
            return FromJson(*parsed);
        }
        std::cerr << "[AnalysisParser] Tool arguments are not a JSON object, falling back to text." << std::endl;
    }
    return ParseText(response.text);
}

} // namespace reflect::application
