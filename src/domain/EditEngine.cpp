/**
 * @file EditEngine.cpp
 * @brief Implementation of the EditEngine domain service.
 */

#include "domain/EditEngine.hpp"
#include "domain/TextUtils.hpp"
#include <sstream>

namespace reflect::domain {

namespace {

bool NonEmpty(const std::optional<std::string>& value) {
    return value.has_value() && !value->empty();
}

} // namespace

std::size_t EditEngine::countOccurrences(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return 0;
    std::size_t count = 0;
    std::size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
        ++count;
        pos = haystack.find(needle, pos + needle.size());
    }
    return count;
}

bool EditEngine::hasUniqueOccurrence(const std::string& text, const std::string& anchor, std::size_t& position) {
    position = text.find(anchor);
    if (position == std::string::npos) return false;
    // Overlapping repeats count as a second match.
    return text.find(anchor, position + 1) == std::string::npos;
}

std::string EditEngine::snippet(const std::string& text) {
    return "\"" + text.substr(0, kSnippetChars) + "...\"";
}

std::string EditEngine::describe(const ProposedEdit& edit) {
    std::ostringstream ss;
    ss << "{type: " << EditKindToString(edit.kind)
       << ", old_text: " << (edit.anchorText ? *edit.anchorText : "null")
       << ", after_text: " << (edit.insertAfterText ? *edit.insertAfterText : "null")
       << ", new_text: " << edit.newText << "}";
    return ss.str().substr(0, 100);
}

EditOutcome EditEngine::apply(const std::string& document, const std::vector<ProposedEdit>& edits) {
    EditOutcome outcome;
    outcome.finalText = document;
    std::string& result = outcome.finalText;

    for (const auto& edit : edits) {
        if (edit.kind == EditKind::Replace && NonEmpty(edit.anchorText) && !edit.newText.empty()) {
            const std::string& anchor = *edit.anchorText;
            std::size_t pos = 0;
            if (result.find(anchor) == std::string::npos) {
                outcome.rejections.push_back({RejectionKind::MissingAnchor,
                    "Could not find text to strengthen: " + snippet(anchor)});
                continue;
            }
            if (!hasUniqueOccurrence(result, anchor, pos)) {
                outcome.rejections.push_back({RejectionKind::Ambiguous,
                    "Ambiguous match (appears multiple times): " + snippet(anchor)});
                continue;
            }
            if (anchor.size() > kDuplicationProbeChars) {
                std::string probe = anchor.substr(0, kDuplicationProbeChars);
                if (countOccurrences(edit.newText, probe) > 1) {
                    outcome.rejections.push_back({RejectionKind::Duplication,
                        "Duplication detected in replacement text: " + snippet(anchor)});
                    continue;
                }
            }
            result.replace(pos, anchor.size(), edit.newText);
            ++outcome.appliedCount;
        } else if (edit.kind == EditKind::Insert && NonEmpty(edit.insertAfterText) && !edit.newText.empty()) {
            const std::string& anchor = *edit.insertAfterText;
            std::size_t pos = 0;
            if (result.find(anchor) == std::string::npos) {
                outcome.rejections.push_back({RejectionKind::MissingAnchor,
                    "Could not find insertion point: " + snippet(anchor)});
                continue;
            }
            if (!hasUniqueOccurrence(result, anchor, pos)) {
                outcome.rejections.push_back({RejectionKind::Ambiguous,
                    "Ambiguous insertion point (appears multiple times): " + snippet(anchor)});
                continue;
            }
            std::string trimmed = Trim(edit.newText);
            if (result.find(trimmed) != std::string::npos) {
                outcome.rejections.push_back({RejectionKind::AlreadyExists,
                    "Text already exists in file: " + snippet(trimmed)});
                continue;
            }
            result.insert(pos + anchor.size(), "\n" + edit.newText);
            ++outcome.appliedCount;
        } else {
            outcome.rejections.push_back({RejectionKind::Invalid, "Invalid edit: " + describe(edit)});
        }
    }

    return outcome;
}

} // namespace reflect::domain
