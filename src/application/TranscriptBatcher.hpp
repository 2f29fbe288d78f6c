/**
 * @file TranscriptBatcher.hpp
 * @brief Splits ranked session transcripts into byte-bounded batches.
 */

#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include "domain/SessionExchange.hpp"

namespace reflect::application {

using TranscriptBatch = std::vector<std::string>;

class TranscriptBatcher {
public:
    /**
     * @brief Greedy, order-preserving batching.
     *
     * Every entry is the session transcript followed by the evidence separator,
     * and the separator counts toward the budget. A session larger than the
     * budget on its own gets a batch of its own; no session is ever dropped.
     */
    static std::vector<TranscriptBatch> Build(const std::vector<domain::SessionRecord>& sessions, std::size_t budget);

    /** @brief Concatenates a batch into evidence text. */
    static std::string Join(const TranscriptBatch& batch);
};

} // namespace reflect::application
