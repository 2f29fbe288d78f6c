/**
 * @file CommandEvidenceSource.hpp
 * @brief Evidence produced by an external command instead of the session log scanner.
 */

#pragma once
#include <string>
#include <cstddef>
#include "domain/SessionExchange.hpp"

namespace reflect::infrastructure {

/**
 * @class CommandEvidenceSource
 * @brief Captures a command's stdout as evidence text.
 *
 * "{lookbackDays}" in the command is replaced by the lookback. Output longer
 * than the byte cap is cut and marked. The session count is the number of
 * lines starting with "### Session:", or 1 when there are none. A failing
 * command yields an empty bundle.
 */
class CommandEvidenceSource {
public:
    static constexpr const char* kTruncationMarker = "\n\n[...truncated to fit context budget]";
    static constexpr const char* kSessionHeader = "### Session:";

    static domain::EvidenceBundle Collect(const std::string& command, int lookbackDays, std::size_t maxBytes);

    /** @brief Counts lines starting with the session header. */
    static int CountSessionHeaders(const std::string& text);
};

} // namespace reflect::infrastructure
