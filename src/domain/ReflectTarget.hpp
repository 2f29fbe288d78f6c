/**
 * @file ReflectTarget.hpp
 * @brief Configuration of a document to reflect on and where its evidence comes from.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace reflect::domain {

/**
 * @enum ContextSourceType
 * @brief Kinds of auxiliary text sources.
 */
enum class ContextSourceType {
    Files,   ///< Paths or single-directory globs.
    Command, ///< Shell command, stdout captured.
    Url      ///< HTTP GET.
};

/**
 * @struct ContextSource
 * @brief One auxiliary source. "{lookbackDays}" is interpolated in paths, command and url.
 */
struct ContextSource {
    ContextSourceType type = ContextSourceType::Files;
    std::optional<std::string> label;
    std::vector<std::string> paths;
    std::optional<std::string> command;
    std::optional<std::string> url;
    std::optional<std::size_t> maxBytes;

    static constexpr std::size_t kDefaultMaxBytes = 100 * 1024;
};

/**
 * @enum TranscriptSourceType
 * @brief Where the primary evidence comes from when no transcript sources are listed.
 */
enum class TranscriptSourceType {
    SessionLogs, ///< "pi-sessions": scan the session log directory.
    Command      ///< External command printing transcripts.
};

struct TranscriptSource {
    TranscriptSourceType type = TranscriptSourceType::SessionLogs;
    std::optional<std::string> command;
};

/**
 * @struct ReflectTarget
 * @brief A document under reflection and the knobs of its runs.
 */
struct ReflectTarget {
    std::string path;
    std::string schedule = "daily";
    std::string model = "anthropic/claude-sonnet-4-5";
    int lookbackDays = 1;
    std::size_t maxSessionBytes = 600 * 1024;
    std::string backupDir;
    TranscriptSource transcriptSource;
    /** Sources read like context sources and used as evidence; take precedence over transcriptSource. */
    std::vector<ContextSource> transcripts;
    /** Template with {fileName}, {targetContent}, {transcripts} and {context} placeholders. */
    std::optional<std::string> prompt;
    std::vector<ContextSource> context;
};

struct ReflectConfig {
    std::vector<ReflectTarget> targets;
};

} // namespace reflect::domain
