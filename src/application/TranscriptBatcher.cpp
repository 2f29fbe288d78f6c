#include "application/TranscriptBatcher.hpp"
#include "application/EvidenceCollector.hpp"

namespace reflect::application {

std::vector<TranscriptBatch> TranscriptBatcher::Build(const std::vector<domain::SessionRecord>& sessions, std::size_t budget) {
    std::vector<TranscriptBatch> batches;
    TranscriptBatch current;
    std::size_t currentSize = 0;

    for (const auto& session : sessions) {
        std::string entry = session.formattedTranscript + EvidenceCollector::kEntrySeparator;
        if (!current.empty() && currentSize + entry.size() > budget) {
            batches.push_back(std::move(current));
            current.clear();
            currentSize = 0;
        }
        currentSize += entry.size();
        current.push_back(std::move(entry));
    }
    if (!current.empty()) {
        batches.push_back(std::move(current));
    }
    return batches;
}

std::string TranscriptBatcher::Join(const TranscriptBatch& batch) {
    std::string text;
    for (const auto& entry : batch) {
        text += entry;
    }
    return text;
}

} // namespace reflect::application
