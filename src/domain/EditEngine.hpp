/**
 * @file EditEngine.hpp
 * @brief Domain service that applies anchored edits to document text.
 */

#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include "ProposedEdit.hpp"

namespace reflect::domain {

/**
 * @class EditEngine
 * @brief Pure text-to-text transform. Never touches storage.
 *
 * Edits are applied in list order and each one sees the result of the
 * previous ones. An edit is rejected, in this order, when it is malformed,
 * when its anchor is missing, when its anchor occurs more than once, when a
 * long replace anchor is echoed back twice in the new text, or when an
 * inserted text is already present. Rejections never stop the remaining edits.
 */
class EditEngine {
public:
    /** Anchors longer than this are checked for echo duplication. */
    static constexpr std::size_t kDuplicationProbeChars = 50;
    /** Characters of offending text quoted in a rejection message. */
    static constexpr std::size_t kSnippetChars = 80;

    static EditOutcome apply(const std::string& document, const std::vector<ProposedEdit>& edits);

    /** @brief Number of non-overlapping occurrences of needle in haystack. */
    static std::size_t countOccurrences(const std::string& haystack, const std::string& needle);

private:
    static bool hasUniqueOccurrence(const std::string& text, const std::string& anchor, std::size_t& position);
    static std::string snippet(const std::string& text);
    static std::string describe(const ProposedEdit& edit);
};

} // namespace reflect::domain
