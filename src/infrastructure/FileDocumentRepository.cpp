/**
 * @file FileDocumentRepository.cpp
 * @brief Implementation of the FileDocumentRepository class.
 */
#include "infrastructure/FileDocumentRepository.hpp"
#include "infrastructure/TimeUtils.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace reflect::infrastructure {

bool FileDocumentRepository::exists(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::optional<std::string> FileDocumentRepository::read(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

bool FileDocumentRepository::write(const std::string& path, const std::string& content) {
    // Write through symlinks: the rename must land on the real file, not replace the link.
    std::error_code resolveEc;
    fs::path finalPath = fs::weakly_canonical(fs::path(path), resolveEc);
    if (resolveEc) {
        std::cerr << "[FileDocumentRepository] Could not resolve " << path << ": " << resolveEc.message() << std::endl;
        return false;
    }

    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const std::exception& e) {
        std::cerr << "[FileDocumentRepository] Error creating directories: " << e.what() << std::endl;
        return false;
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary);
        if (!ofs.is_open()) {
            std::cerr << "[FileDocumentRepository] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[FileDocumentRepository] Write failed during output: " << tempPath << std::endl;
            std::error_code ec;
            fs::remove(tempPath, ec);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[FileDocumentRepository] Rename failed: " << ec.message() << std::endl;
        fs::remove(tempPath, ec);
        return false;
    }
    return true;
}

std::string FileDocumentRepository::BackupFileName(const std::string& documentPath, const std::string& timestamp) {
    fs::path p(documentPath);
    return p.stem().string() + "_" + timestamp + p.extension().string();
}

std::optional<std::string> FileDocumentRepository::createBackup(const std::string& path, const std::string& backupDir) {
    try {
        fs::create_directories(backupDir);
        fs::path backupPath = fs::path(backupDir) / BackupFileName(path, TimeUtils::FormatBackupTimestamp());
        fs::copy_file(path, backupPath, fs::copy_options::overwrite_existing);
        return backupPath.string();
    } catch (const std::exception& e) {
        std::cerr << "[FileDocumentRepository] Backup failed: " << e.what() << std::endl;
        return std::nullopt;
    }
}

bool FileDocumentRepository::removeBackup(const std::string& backupPath) {
    std::error_code ec;
    bool removed = fs::remove(backupPath, ec);
    if (ec) {
        std::cerr << "[FileDocumentRepository] Could not remove backup " << backupPath << ": " << ec.message() << std::endl;
        return false;
    }
    return removed;
}

} // namespace reflect::infrastructure
