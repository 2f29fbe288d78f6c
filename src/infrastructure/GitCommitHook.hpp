/**
 * @file GitCommitHook.hpp
 * @brief Commits a rewritten target file when it lives inside a git work tree.
 */

#pragma once
#include <string>

namespace reflect::infrastructure {

class GitCommitHook {
public:
    /**
     * @brief Stages and commits the file with the given message.
     *
     * Symlinks are resolved first, so git runs in the real file's work tree.
     * @return true if a commit was created. Failures are logged and otherwise ignored.
     */
    static bool CommitFile(const std::string& filePath, const std::string& message);

    /** @brief "reflect: <file> - N edits from M sessions". */
    static std::string CommitMessage(const std::string& fileName, int editsApplied, int sessionsAnalyzed);
};

} // namespace reflect::infrastructure
