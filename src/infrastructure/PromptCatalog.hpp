/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the reflection prompts.
 */

#pragma once

#include <string>
#include "domain/ReflectTarget.hpp"

namespace reflect::infrastructure {

class PromptCatalog {
public:
    /** @brief System prompt for the analysis model. */
    static std::string GetSystemPrompt();

    /** @brief The built-in reflection prompt. Context is appended as its own section when non-empty. */
    static std::string GetReflectionPrompt(const std::string& fileName,
                                           const std::string& targetContent,
                                           const std::string& transcripts,
                                           const std::string& context = "");

    /**
     * @brief Prompt for a target: its custom template when it has one, the built-in prompt otherwise.
     *
     * Templates may use {fileName}, {targetContent}, {transcripts} and {context};
     * every occurrence is replaced textually.
     */
    static std::string BuildForTarget(const domain::ReflectTarget& target,
                                      const std::string& targetPath,
                                      const std::string& targetContent,
                                      const std::string& transcripts,
                                      const std::string& context);
};

} // namespace reflect::infrastructure
