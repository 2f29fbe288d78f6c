/**
 * @file TestSupport.hpp
 * @brief Fixtures shared by the test executables.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace reflect::test {

/** @brief A realistic behavioral file, comfortably above the 100 byte minimum. */
inline const std::string SAMPLE_AGENTS_MD =
    "# Agent Guidelines\n"
    "\n"
    "## Communication\n"
    "- **Be concise.** Answer the question that was asked, then stop.\n"
    "- **No filler.** Skip preambles like \"Great question!\".\n"
    "\n"
    "## Code Changes\n"
    "- **Keep diffs minimal.** Touch only the lines the task needs.\n"
    "- **Run the tests** before declaring a change done.\n"
    "\n"
    "## Tools\n"
    "- **Prefer ripgrep** over grep for searching the tree.\n";

/** @brief Fresh directory under the system temp dir, removed on destruction. */
class TempDir {
public:
    explicit TempDir(const std::string& name) {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path() / (name + "_" + std::to_string(stamp));
        std::filesystem::create_directories(m_path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }
    std::string str() const { return m_path.string(); }

private:
    std::filesystem::path m_path;
};

inline void WriteFile(const std::filesystem::path& path, const std::string& content) {
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());
    std::ofstream f(path, std::ios::binary);
    f << content;
}

inline std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

/** @brief One JSONL message record as written by the agent's session logger. */
inline std::string MessageLine(const std::string& role, const std::string& text, const std::string& thinking = "") {
    nlohmann::json content = nlohmann::json::array();
    if (!thinking.empty()) {
        content.push_back({{"type", "thinking"}, {"thinking", thinking}});
    }
    if (!text.empty()) {
        content.push_back({{"type", "text"}, {"text", text}});
    }
    nlohmann::json line = {
        {"type", "message"},
        {"message", {{"role", role}, {"content", content}}}
    };
    return line.dump();
}

/** @brief A session log with alternating user and assistant turns. */
inline std::string SessionLog(int userTurns, int assistantTurns, const std::string& topic = "task") {
    std::string log = "{\"type\":\"session\",\"id\":\"abc\"}\n";
    int i = 0;
    while (userTurns > 0 || assistantTurns > 0) {
        if (userTurns > 0) {
            log += MessageLine("user", "user says " + topic + " " + std::to_string(i)) + "\n";
            --userTurns;
        }
        if (assistantTurns > 0) {
            log += MessageLine("assistant", "agent answers " + topic + " " + std::to_string(i)) + "\n";
            --assistantTurns;
        }
        ++i;
    }
    return log;
}

} // namespace reflect::test
