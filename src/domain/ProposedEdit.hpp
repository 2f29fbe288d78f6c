/**
 * @file ProposedEdit.hpp
 * @brief Domain value objects for anchored edits and their application outcome.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>

namespace reflect::domain {

/**
 * @enum EditKind
 * @brief Replace an exact span, or insert a new line after one.
 */
enum class EditKind {
    Replace, ///< "strengthen" on the wire.
    Insert,  ///< "add" on the wire.
    Unknown
};

inline std::string EditKindToString(EditKind kind) {
    switch (kind) {
        case EditKind::Replace: return "strengthen";
        case EditKind::Insert: return "add";
        case EditKind::Unknown: return "unknown";
    }
    return "unknown";
}

inline EditKind EditKindFromString(const std::string& value) {
    if (value == "strengthen") return EditKind::Replace;
    if (value == "add") return EditKind::Insert;
    return EditKind::Unknown;
}

/**
 * @struct ProposedEdit
 * @brief One edit proposed by the analysis collaborator.
 *
 * Replace edits use anchorText; insert edits use insertAfterText.
 */
struct ProposedEdit {
    EditKind kind = EditKind::Unknown;
    std::optional<std::string> anchorText;
    std::optional<std::string> insertAfterText;
    std::string newText;
    std::optional<std::string> section;
    std::optional<std::string> reason;
};

/**
 * @enum RejectionKind
 * @brief Why a single edit was not applied.
 */
enum class RejectionKind {
    Invalid,
    MissingAnchor,
    Ambiguous,
    Duplication,
    AlreadyExists
};

struct EditRejection {
    RejectionKind kind;
    std::string message; ///< Operator readable reason with a snippet of the offending text.
};

/**
 * @struct EditOutcome
 * @brief Result of applying an edit list to one document text.
 */
struct EditOutcome {
    std::string finalText;
    int appliedCount = 0;
    std::vector<EditRejection> rejections;

    std::vector<std::string> rejectionMessages() const {
        std::vector<std::string> out;
        out.reserve(rejections.size());
        for (const auto& r : rejections) {
            out.push_back(r.message);
        }
        return out;
    }
};

} // namespace reflect::domain
