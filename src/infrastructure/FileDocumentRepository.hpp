/**
 * @file FileDocumentRepository.hpp
 * @brief Filesystem-based implementation of the DocumentRepository.
 */

#pragma once
#include "domain/DocumentRepository.hpp"
#include <string>

namespace reflect::infrastructure {

/**
 * @class FileDocumentRepository
 * @brief Plain files on disk. Writes go through a temp file and a rename.
 *
 * A symlinked document is written through: the temp file is created beside
 * the resolved file and renamed onto it, so the link itself is kept.
 *
 * Backups are plain copies named "<stem>_<YYYYMMDD_HHMMSS><ext>".
 */
class FileDocumentRepository : public domain::DocumentRepository {
public:
    bool exists(const std::string& path) override;
    std::optional<std::string> read(const std::string& path) override;
    bool write(const std::string& path, const std::string& content) override;
    std::optional<std::string> createBackup(const std::string& path, const std::string& backupDir) override;
    bool removeBackup(const std::string& backupPath) override;

    /** @brief Backup file name for a document at a given timestamp. */
    static std::string BackupFileName(const std::string& documentPath, const std::string& timestamp);
};

} // namespace reflect::infrastructure
