#include "infrastructure/PromptCatalog.hpp"
#include <filesystem>

namespace reflect::infrastructure {

std::string PromptCatalog::GetSystemPrompt() {
    return
        "You are a behavioral analysis tool. You read agent session transcripts and report "
        "correction patterns as structured data. Submit your answer with the submit_analysis tool, "
        "or, if tools are unavailable, reply with ONLY a valid JSON object and nothing else.";
}

std::string PromptCatalog::GetReflectionPrompt(const std::string& fileName,
                                               const std::string& targetContent,
                                               const std::string& transcripts,
                                               const std::string& context) {
    std::string prompt =
        "You are reviewing recent agent session transcripts to improve " + fileName + ".\n\n"
        "## Input\n\n"
        "### Target file: " + fileName + "\n"
        "<target_file>\n" + targetContent + "\n</target_file>\n\n"
        "### Session transcripts\n"
        "<transcripts>\n" + transcripts + "\n</transcripts>\n\n";

    if (!context.empty()) {
        prompt +=
            "### Additional context\n"
            "<context>\n" + context + "\n</context>\n\n";
    }

    prompt +=
        "## Step 1: Find correction patterns\n\n"
        "Look for places where the user had to steer the agent:\n"
        "- redirecting it (\"no\", \"not that\", \"I said...\", \"wrong\", \"actually...\")\n"
        "- showing frustration or repeating an instruction\n"
        "- asking it to undo, revert or simplify what it did\n"
        "- correcting its approach or its understanding of the task\n"
        "- thinking that reveals a misunderstanding the user then corrects\n\n"
        "For each real correction note what the agent did, what the user wanted, and which rule in "
        + fileName + " (if any) already covers it. Ordinary conversation is not a correction: "
        "\"no worries\" or \"actually, that looks good\" do not count.\n\n"
        "## Step 2: Propose edits\n\n"
        "- Only address patterns that actually occur in the transcripts.\n"
        "- If a rule exists but was still violated, STRENGTHEN its wording (emphasis, a concrete example).\n"
        "- If no rule covers a pattern, ADD a bullet to the most fitting existing section.\n"
        "- Never reorganize or restructure the file, and never remove existing rules.\n"
        "- Skip one-off situations; a pattern needs 2+ occurrences across different sessions.\n"
        "- Match the tone and style of the existing file.\n\n"
        "## Step 3: Output\n\n"
        "Anchors must be copied character-for-character from the file and must be complete lines or bullets.\n"
        "For \"strengthen\": old_text is the complete existing bullet, new_text is its full replacement.\n"
        "For \"add\": after_text is the complete existing line to insert after, new_text is one new bullet.\n"
        "Never duplicate content: new_text extends or replaces old_text, it does not repeat it.\n\n"
        "Output a single JSON object, starting with { and ending with }:\n\n"
        "{\n"
        "  \"corrections_found\": <number>,\n"
        "  \"sessions_with_corrections\": <number>,\n"
        "  \"edits\": [\n"
        "    {\n"
        "      \"type\": \"strengthen\" | \"add\",\n"
        "      \"section\": \"section of the file\",\n"
        "      \"old_text\": \"exact text to replace (strengthen) or null\",\n"
        "      \"new_text\": \"replacement or inserted text\",\n"
        "      \"after_text\": \"exact text to insert after (add) or null\",\n"
        "      \"reason\": \"why, with session evidence\"\n"
        "    }\n"
        "  ],\n"
        "  \"patterns_not_added\": [\n"
        "    { \"pattern\": \"description\", \"reason\": \"one-off, already covered, ...\" }\n"
        "  ],\n"
        "  \"summary\": \"2-3 sentences on what was found and changed\"\n"
        "}";
    return prompt;
}

std::string PromptCatalog::BuildForTarget(const domain::ReflectTarget& target,
                                          const std::string& targetPath,
                                          const std::string& targetContent,
                                          const std::string& transcripts,
                                          const std::string& context) {
    std::string fileName = std::filesystem::path(targetPath).filename().string();
    if (!target.prompt || target.prompt->empty()) {
        return GetReflectionPrompt(fileName, targetContent, transcripts, context);
    }

    // Single left-to-right pass: substituted text is never rescanned.
    const std::string& tmpl = *target.prompt;
    std::string out;
    out.reserve(tmpl.size() + targetContent.size() + transcripts.size() + context.size());
    size_t pos = 0;
    while (pos < tmpl.size()) {
        size_t open = tmpl.find('{', pos);
        if (open == std::string::npos) {
            out.append(tmpl, pos, std::string::npos);
            break;
        }
        out.append(tmpl, pos, open - pos);
        size_t close = tmpl.find('}', open);
        if (close == std::string::npos) {
            out.append(tmpl, open, std::string::npos);
            break;
        }
        std::string key = tmpl.substr(open + 1, close - open - 1);
        if (key == "fileName") {
            out += fileName;
        } else if (key == "targetContent") {
            out += targetContent;
        } else if (key == "transcripts") {
            out += transcripts;
        } else if (key == "context") {
            out += context;
        } else {
            out += '{';
            pos = open + 1;
            continue;
        }
        pos = close + 1;
    }
    return out;
}

} // namespace reflect::infrastructure
