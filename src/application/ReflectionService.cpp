/**
 * @file ReflectionService.cpp
 * @brief Implementation of the ReflectionService.
 */

#include "application/ReflectionService.hpp"
#include "application/AnalysisParser.hpp"
#include "application/TranscriptBatcher.hpp"
#include "domain/EditEngine.hpp"
#include "domain/TextUtils.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include "infrastructure/TimeUtils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace reflect::application {

namespace {

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::string Join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

std::string Kilobytes(std::size_t bytes) {
    return std::to_string((bytes + 512) / 1024) + "KB";
}

ReflectionResult Abort(ReflectionStatus status, std::string message) {
    ReflectionResult result;
    result.status = status;
    result.message = std::move(message);
    return result;
}

} // namespace

std::string ReflectionStatusToString(ReflectionStatus status) {
    switch (status) {
        case ReflectionStatus::Completed: return "completed";
        case ReflectionStatus::NotFound: return "not found";
        case ReflectionStatus::TooSmall: return "too small";
        case ReflectionStatus::NoEvidence: return "no evidence";
        case ReflectionStatus::ModelUnavailable: return "model unavailable";
        case ReflectionStatus::AnalysisTransportError: return "analysis transport error";
        case ReflectionStatus::AnalysisParseError: return "analysis parse error";
        case ReflectionStatus::AllEditsRejected: return "all edits rejected";
        case ReflectionStatus::ResultTooSmall: return "result too small";
        case ReflectionStatus::WriteFailed: return "write failed";
    }
    return "unknown";
}

ReflectionService::ReflectionService(std::shared_ptr<domain::AnalysisService> analysis,
                                     std::shared_ptr<domain::ModelRegistry> models,
                                     std::shared_ptr<domain::DocumentRepository> documents,
                                     EvidenceSources sources,
                                     PostWriteHook postWrite)
    : m_analysis(std::move(analysis)),
      m_models(std::move(models)),
      m_documents(std::move(documents)),
      m_sources(std::move(sources)),
      m_postWrite(std::move(postWrite)) {}

std::size_t ReflectionService::BatchBudget(std::size_t maxSessionBytes, std::size_t documentBytes, std::size_t contextBytes) {
    long long budget = static_cast<long long>(maxSessionBytes)
        - (static_cast<long long>(documentBytes) + static_cast<long long>(contextBytes) + kPromptOverheadBytes);
    return static_cast<std::size_t>(std::max(budget, kMinBatchBytes));
}

int ReflectionService::CountChangedLines(const std::string& before, const std::string& after) {
    auto a = SplitLines(before);
    auto b = SplitLines(after);
    size_t n = std::max(a.size(), b.size());
    int changed = 0;
    for (size_t i = 0; i < n; ++i) {
        if (i >= a.size() || i >= b.size() || a[i] != b[i]) {
            ++changed;
        }
    }
    return changed;
}

int ReflectionService::EstimateSessionCount(const std::string& text) {
    int count = 0;
    for (const auto& line : SplitLines(text)) {
        if (line.compare(0, 3, "###") != 0) continue;
        if (line.size() == 3 || std::isspace(static_cast<unsigned char>(line[3]))) {
            ++count;
        }
    }
    return count > 0 ? count : 1;
}

domain::EvidenceBundle ReflectionService::gatherEvidence(const domain::ReflectTarget& target,
                                                         const NotifyFn& notify,
                                                         const ReflectionOptions& options) {
    if (options.evidenceOverride) {
        return *options.evidenceOverride;
    }

    std::string window = "(last " + std::to_string(target.lookbackDays) + " day(s))";

    if (!target.transcripts.empty() && m_sources.context) {
        notify("Extracting transcripts from " + std::to_string(target.transcripts.size()) + " source(s) " + window + "...", "info");
        domain::EvidenceBundle bundle;
        bundle.text = m_sources.context(target.transcripts, target.lookbackDays);
        bundle.sessionsScanned = EstimateSessionCount(bundle.text);
        bundle.sessionsIncluded = bundle.sessionsScanned;
        return bundle;
    }

    if (target.transcriptSource.type == domain::TranscriptSourceType::Command
        && target.transcriptSource.command && m_sources.command) {
        notify("Extracting transcripts " + window + "...", "info");
        return m_sources.command(*target.transcriptSource.command, target.lookbackDays, target.maxSessionBytes);
    }

    if (!m_sources.sessions) {
        return {};
    }
    notify("Extracting transcripts " + window + "...", "info");
    return m_sources.sessions(target.lookbackDays, target.maxSessionBytes);
}

ReflectionResult ReflectionService::run(const domain::ReflectTarget& target,
                                        const NotifyFn& notify,
                                        const ReflectionOptions& options) {
    const std::string targetPath = infrastructure::PathUtils::ResolvePath(target.path);

    // --- Loaded ---
    if (!m_documents->exists(targetPath)) {
        std::string msg = "Target file not found: " + targetPath;
        notify(msg, "error");
        return Abort(ReflectionStatus::NotFound, msg);
    }
    auto original = m_documents->read(targetPath);
    if (!original) {
        std::string msg = "Target file could not be read: " + targetPath;
        notify(msg, "error");
        return Abort(ReflectionStatus::NotFound, msg);
    }
    if (original->size() < kMinDocumentBytes) {
        std::string msg = "Target file too small (" + std::to_string(original->size()) + " bytes): " + targetPath;
        notify(msg, "error");
        return Abort(ReflectionStatus::TooSmall, msg);
    }

    // --- EvidenceGathered ---
    domain::EvidenceBundle evidence = gatherEvidence(target, notify, options);
    if (evidence.isEmpty()) {
        std::string msg = "No substantive sessions found (" + std::to_string(evidence.sessionsScanned)
            + " scanned). Nothing to reflect on.";
        notify(msg, "info");
        return Abort(ReflectionStatus::NoEvidence, msg);
    }
    notify("Extracted " + std::to_string(evidence.sessionsIncluded) + " sessions ("
           + std::to_string(evidence.sessionsScanned) + " scanned, " + Kilobytes(evidence.text.size()) + ")", "info");

    auto slash = target.model.find('/');
    std::string provider = slash == std::string::npos ? std::string() : target.model.substr(0, slash);
    std::string modelId = slash == std::string::npos ? target.model : target.model.substr(slash + 1);
    auto model = m_models->findModel(provider, modelId);
    if (!model) {
        std::string msg = "Model not found: " + target.model;
        notify(msg, "error");
        return Abort(ReflectionStatus::ModelUnavailable, msg);
    }
    auto apiKey = m_models->getApiKey(*model);
    if (!apiKey) {
        std::string msg = "No API key for model: " + target.model;
        notify(msg, "error");
        return Abort(ReflectionStatus::ModelUnavailable, msg);
    }

    std::string context;
    if (!target.context.empty() && m_sources.context) {
        notify("Collecting context from " + std::to_string(target.context.size()) + " source(s)...", "info");
        context = m_sources.context(target.context, target.lookbackDays);
        if (!context.empty()) {
            notify("Collected " + Kilobytes(context.size()) + " of additional context", "info");
        }
    }

    std::vector<std::string> batchTexts;
    std::size_t budget = BatchBudget(target.maxSessionBytes, original->size(), context.size());
    if (evidence.text.size() > budget && evidence.sessions && !evidence.sessions->empty()) {
        auto batches = TranscriptBatcher::Build(*evidence.sessions, budget);
        if (batches.size() > 1) {
            notify("Evidence exceeds " + Kilobytes(budget) + ", splitting into "
                   + std::to_string(batches.size()) + " batches", "info");
        }
        for (size_t i = 0; i < batches.size(); ++i) {
            std::string header = "# Session Transcripts (batch " + std::to_string(i + 1) + " of "
                + std::to_string(batches.size()) + ", " + std::to_string(batches[i].size()) + " sessions)\n\n";
            batchTexts.push_back(header + TranscriptBatcher::Join(batches[i]));
        }
    } else {
        batchTexts.push_back(evidence.text);
    }
    const bool multiBatch = batchTexts.size() > 1;
    const std::size_t batchCount = batchTexts.size();

    // --- PerBatch ---
    int correctionsFound = 0;
    int editsProposed = 0;
    int editsApplied = 0;
    size_t failedBatches = 0;
    ReflectionStatus lastFailure = ReflectionStatus::AnalysisTransportError;
    bool sizeGuardTripped = false;
    std::optional<std::string> backupPath;
    std::vector<std::string> summaries;
    std::vector<std::string> rejections;
    std::vector<domain::EditRecord> records;

    auto discardBackup = [&]() {
        if (backupPath && !m_documents->removeBackup(*backupPath)) {
            notify("Could not remove backup: " + *backupPath, "warning");
        }
        backupPath.reset();
    };

    for (size_t i = 0; i < batchCount; ++i) {
        std::string label = multiBatch ? " (batch " + std::to_string(i + 1) + "/" + std::to_string(batchCount) + ")" : "";

        auto current = m_documents->read(targetPath);
        if (!current) {
            std::string msg = "Target file could not be read: " + targetPath;
            notify(msg, "error");
            if (editsApplied == 0) discardBackup();
            return Abort(ReflectionStatus::NotFound, msg);
        }

        notify("Analyzing with " + target.model + label + "...", "info");
        domain::AnalysisRequest request;
        request.systemPrompt = infrastructure::PromptCatalog::GetSystemPrompt();
        request.prompt = infrastructure::PromptCatalog::BuildForTarget(target, targetPath, *current, batchTexts[i], context);
        request.maxTokens = kMaxTokens;

        domain::AnalysisResponse response = m_analysis->analyze(*model, *apiKey, request);
        if (!response.ok) {
            std::string msg = "Analysis failed" + label + ": " + response.errorMessage;
            if (!multiBatch) {
                notify(msg, "error");
                return Abort(ReflectionStatus::AnalysisTransportError, msg);
            }
            notify(msg + ". Skipping batch.", "warning");
            ++failedBatches;
            lastFailure = ReflectionStatus::AnalysisTransportError;
            continue;
        }

        auto analysis = AnalysisParser::Parse(response);
        if (!analysis) {
            std::string raw = response.toolArguments ? *response.toolArguments : response.text;
            std::string msg = "Failed to parse analysis response as JSON" + label + ". Raw response:\n" + raw.substr(0, 500);
            if (!multiBatch) {
                notify(msg, "error");
                return Abort(ReflectionStatus::AnalysisParseError, msg);
            }
            notify(msg, "warning");
            ++failedBatches;
            lastFailure = ReflectionStatus::AnalysisParseError;
            continue;
        }

        correctionsFound += analysis->correctionsFound;
        if (analysis->summary) {
            summaries.push_back(*analysis->summary);
        }
        for (const auto& edit : analysis->edits) {
            if (edit.section && edit.reason) {
                domain::EditRecord record;
                record.kind = edit.kind == domain::EditKind::Unknown ? domain::EditKind::Insert : edit.kind;
                record.section = *edit.section;
                record.reason = *edit.reason;
                records.push_back(std::move(record));
            }
        }

        if (analysis->edits.empty()) {
            notify("No edits needed" + label + ".", "info");
            continue;
        }
        editsProposed += static_cast<int>(analysis->edits.size());

        if (options.dryRun) {
            notify("[dry run] " + std::to_string(analysis->edits.size()) + " edit(s) proposed" + label, "info");
            continue;
        }

        // --- Patched ---
        domain::EditOutcome outcome = domain::EditEngine::apply(*current, analysis->edits);
        auto messages = outcome.rejectionMessages();
        rejections.insert(rejections.end(), messages.begin(), messages.end());

        if (outcome.appliedCount == 0) {
            notify("All " + std::to_string(analysis->edits.size()) + " edits failed to apply" + label
                   + ". Skipped: " + Join(messages, "; "), "warning");
            continue;
        }

        if (static_cast<double>(outcome.finalText.size()) < static_cast<double>(original->size()) * kMinResultRatio) {
            std::string msg = "Result is suspiciously small (" + std::to_string(outcome.finalText.size()) + " vs "
                + std::to_string(original->size()) + " bytes)" + label + ". Not writing.";
            notify(msg, "error");
            sizeGuardTripped = true;
            if (!multiBatch) {
                return Abort(ReflectionStatus::ResultTooSmall, msg);
            }
            continue;
        }

        if (!backupPath) {
            backupPath = m_documents->createBackup(targetPath, infrastructure::PathUtils::ResolvePath(target.backupDir));
            if (!backupPath) {
                std::string msg = "Could not create backup in " + target.backupDir + ". Document left unchanged.";
                notify(msg, "error");
                return Abort(ReflectionStatus::WriteFailed, msg);
            }
        }

        if (!m_documents->write(targetPath, outcome.finalText)) {
            std::string msg = "Could not write " + targetPath + label;
            notify(msg, "error");
            if (editsApplied == 0) discardBackup();
            return Abort(ReflectionStatus::WriteFailed, msg);
        }
        editsApplied += outcome.appliedCount;

        if (!messages.empty()) {
            notify("Applied " + std::to_string(outcome.appliedCount) + "/" + std::to_string(analysis->edits.size())
                   + " edits" + label + " (" + std::to_string(messages.size()) + " skipped). Backup: " + *backupPath, "warning");
        } else {
            notify("Applied " + std::to_string(outcome.appliedCount) + " edit(s)" + label + ". Backup: " + *backupPath, "info");
        }
    }

    // --- Finalized ---
    if (failedBatches == batchCount) {
        std::string msg = "All " + std::to_string(batchCount) + " batches failed. Nothing was applied.";
        notify(msg, "error");
        return Abort(lastFailure, msg);
    }

    if (!options.dryRun && editsProposed > 0 && editsApplied == 0) {
        discardBackup();
        if (sizeGuardTripped) {
            std::string msg = "Every batch result was suspiciously small. Document left unchanged.";
            notify(msg, "error");
            return Abort(ReflectionStatus::ResultTooSmall, msg);
        }
        std::string msg = "All " + std::to_string(editsProposed) + " edits failed to apply. Skipped: " + Join(rejections, "; ");
        notify(msg, "warning");
        return Abort(ReflectionStatus::AllEditsRejected, msg);
    }

    domain::ReflectionRun run;
    run.timestamp = infrastructure::TimeUtils::IsoTimestamp();
    run.targetPath = targetPath;
    run.sessionsAnalyzed = evidence.sessionsIncluded;
    run.correctionsFound = correctionsFound;
    run.editsApplied = editsApplied;
    run.correctionRate = evidence.sessionsIncluded > 0
        ? static_cast<double>(correctionsFound) / static_cast<double>(evidence.sessionsIncluded)
        : 0.0;
    run.edits = std::move(records);
    run.sourceDate = options.sourceDateOverride
        ? *options.sourceDateOverride
        : infrastructure::TimeUtils::DateDaysAgo(target.lookbackDays);

    if (editsApplied > 0) {
        auto finalText = m_documents->read(targetPath);
        run.diffLines = finalText ? CountChangedLines(*original, *finalText) : 0;
    }

    if (!summaries.empty()) {
        run.summary = Join(summaries, "\n\n");
    } else if (options.dryRun && editsProposed > 0) {
        run.summary = std::to_string(editsProposed) + " edits proposed (dry run).";
    } else if (editsApplied > 0) {
        run.summary = std::to_string(editsApplied) + " edits applied from " + std::to_string(evidence.sessionsIncluded) + " sessions.";
    } else {
        run.summary = "No edits needed.";
    }
    notify(options.dryRun ? "[dry run] " + run.summary : run.summary, "info");

    if (editsApplied > 0 && m_postWrite) {
        if (m_postWrite(targetPath, run)) {
            notify("Committed " + targetPath, "info");
        }
    }

    ReflectionResult result;
    result.status = ReflectionStatus::Completed;
    result.message = run.summary;
    result.run = std::move(run);
    return result;
}

} // namespace reflect::application
