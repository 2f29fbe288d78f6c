/**
 * @file DocumentRepository.hpp
 * @brief Interface for reading, writing and backing up the target document.
 */

#pragma once
#include <string>
#include <optional>

namespace reflect::domain {

/**
 * @class DocumentRepository
 * @brief Abstract storage for the document under reflection.
 */
class DocumentRepository {
public:
    virtual ~DocumentRepository() = default;

    virtual bool exists(const std::string& path) = 0;

    /** @brief Reads the whole file; nullopt if it cannot be read. */
    virtual std::optional<std::string> read(const std::string& path) = 0;

    /** @brief Replaces the file content. Returns false on failure. */
    virtual bool write(const std::string& path, const std::string& content) = 0;

    /**
     * @brief Copies the document into the backup directory.
     * @return Path of the backup, or nullopt if the copy failed.
     */
    virtual std::optional<std::string> createBackup(const std::string& path, const std::string& backupDir) = 0;

    virtual bool removeBackup(const std::string& backupPath) = 0;
};

} // namespace reflect::domain
