/**
 * @file CommandEvidenceSource.cpp
 * @brief Implementation of CommandEvidenceSource.
 */

#include "infrastructure/CommandEvidenceSource.hpp"
#include "infrastructure/CommandRunner.hpp"
#include "domain/TextUtils.hpp"
#include <sstream>

namespace reflect::infrastructure {

int CommandEvidenceSource::CountSessionHeaders(const std::string& text) {
    int count = 0;
    std::istringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        if (domain::StartsWith(line, kSessionHeader)) ++count;
    }
    return count;
}

domain::EvidenceBundle CommandEvidenceSource::Collect(const std::string& command, int lookbackDays, std::size_t maxBytes) {
    domain::EvidenceBundle bundle;
    std::string interpolated = domain::ReplaceAll(command, "{lookbackDays}", std::to_string(lookbackDays));

    auto result = CommandRunner::Run(interpolated, maxBytes * 2);
    if (!result.success) {
        return bundle;
    }

    std::string output = std::move(result.output);
    if (output.size() > maxBytes) {
        output = output.substr(0, maxBytes) + kTruncationMarker;
    }

    int count = CountSessionHeaders(output);
    if (count == 0) count = 1;

    bundle.text = std::move(output);
    bundle.sessionsScanned = count;
    bundle.sessionsIncluded = count;
    return bundle;
}

} // namespace reflect::infrastructure
