/**
 * @file ReflectApp.cpp
 * @brief Implementation of the ReflectApp class.
 */
#include "app/ReflectApp.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>

#include "application/EvidenceCollector.hpp"
#include "application/ReflectionService.hpp"
#include "infrastructure/CommandEvidenceSource.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ContextCollector.hpp"
#include "infrastructure/EnvModelRegistry.hpp"
#include "infrastructure/FileDocumentRepository.hpp"
#include "infrastructure/GitCommitHook.hpp"
#include "infrastructure/HistoryStore.hpp"
#include "infrastructure/LlmAnalysisAdapter.hpp"
#include "infrastructure/TimeUtils.hpp"

namespace reflect::app {

namespace {

constexpr std::size_t kHistoryShown = 10;

void ConsoleNotify(const std::string& message, const std::string& level) {
    std::ostream& out = level == "error" ? std::cerr : std::cout;
    out << "[reflect] [" << level << "] " << message << std::endl;
}

std::string BaseName(const std::string& path) {
    return std::filesystem::path(path).filename().string();
}

} // namespace

CommandLine CommandLine::Parse(const std::vector<std::string>& args) {
    CommandLine cmd;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--dry-run") {
            cmd.dryRun = true;
        } else if (arg == "--save") {
            cmd.save = true;
        } else if (arg == "--date") {
            if (i + 1 >= args.size()) {
                cmd.error = "--date needs a value (YYYY-MM-DD)";
                return cmd;
            }
            cmd.date = args[++i];
            if (!infrastructure::TimeUtils::IsDate(*cmd.date)) {
                cmd.error = "Invalid date: " + *cmd.date + " (expected YYYY-MM-DD)";
                return cmd;
            }
        } else if (arg == "--config") {
            cmd.mode = Mode::Config;
        } else if (arg == "--history") {
            cmd.mode = Mode::History;
        } else if (arg == "--dates") {
            cmd.mode = Mode::Dates;
        } else if (arg == "-h" || arg == "--help") {
            cmd.mode = Mode::Help;
        } else if (!arg.empty() && arg[0] == '-') {
            cmd.error = "Unknown option: " + arg;
            return cmd;
        } else if (!cmd.targetPath) {
            cmd.targetPath = arg;
        } else {
            cmd.error = "Only one target path may be given";
            return cmd;
        }
    }
    return cmd;
}

ReflectApp::ReflectApp(infrastructure::ReflectPaths paths)
    : m_paths(std::move(paths)) {}

std::string ReflectApp::Usage() {
    return
        "Usage:\n"
        "  reflect [path] [--dry-run] [--date YYYY-MM-DD] [--save]\n"
        "  reflect --config     Show configured targets\n"
        "  reflect --history    Show recent runs and recurring sections\n"
        "  reflect --dates      List dates that have session logs\n";
}

int ReflectApp::Run(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return Run(CommandLine::Parse(args));
}

int ReflectApp::Run(const CommandLine& cmd) {
    if (!cmd.error.empty()) {
        std::cerr << cmd.error << "\n" << Usage();
        return 2;
    }
    switch (cmd.mode) {
        case CommandLine::Mode::Help:
            std::cout << Usage();
            return 0;
        case CommandLine::Mode::Config:
            return ShowConfig();
        case CommandLine::Mode::History:
            return ShowHistory();
        case CommandLine::Mode::Dates:
            return ShowDates();
        case CommandLine::Mode::Reflect:
            return RunReflection(cmd);
    }
    return 2;
}

int ReflectApp::RunReflection(const CommandLine& cmd) {
    auto config = infrastructure::ConfigLoader::Load(m_paths);

    domain::ReflectTarget target;
    if (cmd.targetPath) {
        auto existing = infrastructure::ConfigLoader::FindTarget(config, *cmd.targetPath);
        if (existing) {
            target = *existing;
        } else {
            target = infrastructure::ConfigLoader::DefaultTarget(m_paths);
            target.path = *cmd.targetPath;
            if (cmd.save) {
                config.targets.push_back(target);
                if (infrastructure::ConfigLoader::Save(m_paths, config)) {
                    ConsoleNotify("Saved to " + m_paths.configFile.string(), "info");
                }
            }
        }
    } else if (config.targets.empty()) {
        std::cerr << "No targets configured. Use: reflect <path>" << std::endl;
        return 1;
    } else {
        target = config.targets.front();
    }

    application::EvidenceCollector collector(m_paths.sessionsDir.string());
    infrastructure::ContextCollector contextCollector;

    application::EvidenceSources sources;
    sources.sessions = [&collector](int lookbackDays, std::size_t maxBytes) {
        return collector.collect(lookbackDays, maxBytes);
    };
    sources.command = &infrastructure::CommandEvidenceSource::Collect;
    sources.context = [&contextCollector](const std::vector<domain::ContextSource>& list, int lookbackDays) {
        return contextCollector.collect(list, lookbackDays);
    };

    application::PostWriteHook hook = [](const std::string& path, const domain::ReflectionRun& run) {
        return infrastructure::GitCommitHook::CommitFile(
            path, infrastructure::GitCommitHook::CommitMessage(BaseName(path), run.editsApplied, run.sessionsAnalyzed));
    };

    application::ReflectionService service(
        std::make_shared<infrastructure::LlmAnalysisAdapter>(),
        std::make_shared<infrastructure::EnvModelRegistry>(),
        std::make_shared<infrastructure::FileDocumentRepository>(),
        sources,
        hook);

    application::ReflectionOptions options;
    options.dryRun = cmd.dryRun;
    if (cmd.date) {
        ConsoleNotify("Extracting transcripts for " + *cmd.date + "...", "info");
        options.evidenceOverride = collector.collectForDate(*cmd.date, target.maxSessionBytes);
        options.sourceDateOverride = *cmd.date;
    }

    auto result = service.run(target, ConsoleNotify, options);
    if (!result.ok()) {
        return result.status == application::ReflectionStatus::NoEvidence ? 0 : 1;
    }

    if (result.run && !cmd.dryRun) {
        infrastructure::HistoryStore history(m_paths.historyFile.string());
        if (!history.append(*result.run)) {
            ConsoleNotify("Could not update " + m_paths.historyFile.string(), "warning");
        }
    }
    return 0;
}

int ReflectApp::ShowConfig() {
    auto config = infrastructure::ConfigLoader::Load(m_paths);
    if (config.targets.empty()) {
        std::cout << "No targets configured. Use: reflect <path> --save" << std::endl;
        std::cout << "Config file: " << m_paths.configFile.string() << std::endl;
        return 0;
    }

    std::cout << "Reflection targets:" << std::endl;
    for (size_t i = 0; i < config.targets.size(); ++i) {
        const auto& t = config.targets[i];
        std::cout << (i + 1) << ". " << BaseName(t.path) << " - " << t.schedule << ", " << t.model
                  << ", " << t.lookbackDays << "d lookback" << std::endl
                  << "   " << t.path << std::endl;
    }
    std::cout << std::endl << "Edit: " << m_paths.configFile.string() << std::endl;
    return 0;
}

int ReflectApp::ShowHistory() {
    infrastructure::HistoryStore history(m_paths.historyFile.string());
    auto runs = history.load();
    if (runs.empty()) {
        std::cout << "No reflection runs yet. Use: reflect <path>" << std::endl;
        return 0;
    }

    std::cout << "Recent reflections:" << std::endl;
    size_t shown = 0;
    for (auto it = runs.rbegin(); it != runs.rend() && shown < kHistoryShown; ++it, ++shown) {
        std::string when = it->timestamp.substr(0, 16);
        for (auto& c : when) {
            if (c == 'T') c = ' ';
        }
        std::cout << "- " << when << " " << BaseName(it->targetPath) << ": " << it->editsApplied << " edits, "
                  << it->correctionsFound << " corrections (" << it->sessionsAnalyzed << " sessions)" << std::endl
                  << "  " << it->summary << std::endl;
    }

    auto recurring = infrastructure::HistoryStore::RecurringSections(runs);
    if (!recurring.empty()) {
        std::cout << std::endl << "Recurring sections (edited in more than one run):" << std::endl;
        for (const auto& [section, count] : recurring) {
            std::cout << "- " << section << ": " << count << " runs" << std::endl;
        }
    }
    return 0;
}

int ReflectApp::ShowDates() {
    application::EvidenceCollector collector(m_paths.sessionsDir.string());
    auto dates = collector.availableDates();
    if (dates.empty()) {
        std::cout << "No session logs found in " << m_paths.sessionsDir.string() << std::endl;
        return 0;
    }
    for (const auto& date : dates) {
        std::cout << date << std::endl;
    }
    return 0;
}

} // namespace reflect::app
