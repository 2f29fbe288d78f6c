#include "infrastructure/GitCommitHook.hpp"
#include "infrastructure/CommandRunner.hpp"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace reflect::infrastructure {

std::string GitCommitHook::CommitMessage(const std::string& fileName, int editsApplied, int sessionsAnalyzed) {
    return "reflect: " + fileName + " - " + std::to_string(editsApplied) + " edit" + (editsApplied == 1 ? "" : "s")
        + " from " + std::to_string(sessionsAnalyzed) + " session" + (sessionsAnalyzed == 1 ? "" : "s");
}

bool GitCommitHook::CommitFile(const std::string& filePath, const std::string& message) {
    std::error_code ec;
    fs::path file = fs::weakly_canonical(fs::path(filePath), ec);
    if (ec) {
        std::cerr << "[GitCommitHook] Could not resolve " << filePath << ": " << ec.message() << std::endl;
        return false;
    }
    std::string dir = file.parent_path().string();
    if (dir.empty()) dir = ".";
    std::string git = "git -C " + CommandRunner::ShellQuote(dir);

    auto inside = CommandRunner::Run(git + " rev-parse --is-inside-work-tree 2>/dev/null");
    if (!inside.success) {
        return false;
    }

    std::string name = CommandRunner::ShellQuote(file.filename().string());
    auto add = CommandRunner::Run(git + " add -- " + name + " 2>&1");
    if (!add.success) {
        std::cerr << "[GitCommitHook] git add failed: " << add.output << std::endl;
        return false;
    }

    auto commit = CommandRunner::Run(git + " commit --no-verify -m " + CommandRunner::ShellQuote(message) + " -- " + name + " 2>&1");
    if (!commit.success) {
        std::cerr << "[GitCommitHook] git commit failed: " << commit.output << std::endl;
        return false;
    }
    return true;
}

} // namespace reflect::infrastructure
