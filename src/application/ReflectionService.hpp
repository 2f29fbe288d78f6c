/**
 * @file ReflectionService.hpp
 * @brief Application service that runs one reflection pass over a target document.
 */

#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <cstddef>
#include "domain/AnalysisService.hpp"
#include "domain/DocumentRepository.hpp"
#include "domain/ReflectTarget.hpp"
#include "domain/ReflectionRun.hpp"
#include "domain/SessionExchange.hpp"

namespace reflect::application {

/**
 * @enum ReflectionStatus
 * @brief Terminal state of a run. Everything but Completed is an abort.
 */
enum class ReflectionStatus {
    Completed,
    NotFound,
    TooSmall,
    NoEvidence,
    ModelUnavailable,
    AnalysisTransportError,
    AnalysisParseError,
    AllEditsRejected,
    ResultTooSmall,
    WriteFailed
};

std::string ReflectionStatusToString(ReflectionStatus status);

/** @brief Operator-facing progress. level is "info", "warning" or "error". */
using NotifyFn = std::function<void(const std::string& message, const std::string& level)>;

/**
 * @struct EvidenceSources
 * @brief Where a run gets its evidence and auxiliary context from.
 */
struct EvidenceSources {
    /** (lookbackDays, maxBytes) -> bundle from the session log scanner. */
    std::function<domain::EvidenceBundle(int, std::size_t)> sessions;
    /** (command, lookbackDays, maxBytes) -> bundle from an external command. */
    std::function<domain::EvidenceBundle(const std::string&, int, std::size_t)> command;
    /** (sources, lookbackDays) -> rendered context text. */
    std::function<std::string(const std::vector<domain::ContextSource>&, int)> context;
};

/** @brief Invoked after a run wrote the document. Best effort; the return value only drives a notice. */
using PostWriteHook = std::function<bool(const std::string& targetPath, const domain::ReflectionRun& run)>;

struct ReflectionOptions {
    std::optional<domain::EvidenceBundle> evidenceOverride;
    std::optional<std::string> sourceDateOverride; ///< YYYY-MM-DD of the analyzed sessions.
    bool dryRun = false;
};

struct ReflectionResult {
    ReflectionStatus status = ReflectionStatus::Completed;
    std::optional<domain::ReflectionRun> run;
    std::string message;

    bool ok() const { return status == ReflectionStatus::Completed; }
};

/**
 * @class ReflectionService
 * @brief Gathers evidence, asks the analysis model for edits and applies them.
 *
 * Large evidence is split into batches that run strictly in order; each batch
 * reads the document from disk, so it sees what earlier batches wrote. One
 * backup of the pre-run document is taken before the first write and removed
 * again if the run ends without applying anything.
 */
class ReflectionService {
public:
    static constexpr std::size_t kMinDocumentBytes = 100;
    static constexpr long long kPromptOverheadBytes = 20000;
    static constexpr long long kMinBatchBytes = 100000;
    static constexpr double kMinResultRatio = 0.5;
    static constexpr int kMaxTokens = 16384;

    ReflectionService(std::shared_ptr<domain::AnalysisService> analysis,
                      std::shared_ptr<domain::ModelRegistry> models,
                      std::shared_ptr<domain::DocumentRepository> documents,
                      EvidenceSources sources,
                      PostWriteHook postWrite = nullptr);

    ReflectionResult run(const domain::ReflectTarget& target,
                         const NotifyFn& notify,
                         const ReflectionOptions& options = {});

    /** @brief max(maxSessionBytes - (documentBytes + contextBytes + overhead), floor). */
    static std::size_t BatchBudget(std::size_t maxSessionBytes, std::size_t documentBytes, std::size_t contextBytes);

    /** @brief Number of line positions that differ between the two texts. */
    static int CountChangedLines(const std::string& before, const std::string& after);

    /** @brief Lines that are "###" alone or "###" followed by whitespace; 1 when there are none. */
    static int EstimateSessionCount(const std::string& text);

private:
    domain::EvidenceBundle gatherEvidence(const domain::ReflectTarget& target,
                                          const NotifyFn& notify,
                                          const ReflectionOptions& options);

    std::shared_ptr<domain::AnalysisService> m_analysis;
    std::shared_ptr<domain::ModelRegistry> m_models;
    std::shared_ptr<domain::DocumentRepository> m_documents;
    EvidenceSources m_sources;
    PostWriteHook m_postWrite;
};

} // namespace reflect::application
