#include <cassert>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileDocumentRepository.hpp"
#include "infrastructure/HistoryStore.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/TimeUtils.hpp"
#include "TestSupport.hpp"

using namespace reflect;
using infrastructure::ConfigLoader;
using infrastructure::HistoryStore;
using infrastructure::ReflectPaths;
using infrastructure::TimeUtils;
using json = nlohmann::json;

namespace {

domain::ReflectionRun MakeRun(const std::string& summary, const std::vector<std::string>& sections = {}) {
    domain::ReflectionRun run;
    run.timestamp = "2026-01-16T12:00:00.000Z";
    run.targetPath = "/work/AGENTS.md";
    run.sessionsAnalyzed = 4;
    run.correctionsFound = 2;
    run.editsApplied = 1;
    run.summary = summary;
    run.diffLines = 3;
    run.correctionRate = 0.5;
    for (const auto& s : sections) {
        run.edits.push_back({domain::EditKind::Replace, s, "seen again"});
    }
    return run;
}

} // namespace

void TestConfigDefaultsAndMerge() {
    std::cout << "[Test] Config defaults..." << std::endl;
    test::TempDir dir("reflect_config");
    ReflectPaths paths = ReflectPaths::FromAgentDir(dir.path());

    assert(ConfigLoader::Load(paths).targets.empty());

    test::WriteFile(paths.configFile, R"({"targets": [42, {"path": "~/AGENTS.md", "lookbackDays": 3}]})");
    auto config = ConfigLoader::Load(paths);
    assert(config.targets.size() == 1);
    const auto& t = config.targets[0];
    assert(t.path == "~/AGENTS.md");
    assert(t.lookbackDays == 3);
    assert(t.schedule == "daily");
    assert(t.model == "anthropic/claude-sonnet-4-5");
    assert(t.maxSessionBytes == 600 * 1024);
    assert(t.backupDir == paths.backupDir.string());
    assert(t.transcriptSource.type == domain::TranscriptSourceType::SessionLogs);
    assert(!t.prompt);
    assert(t.context.empty());

    test::WriteFile(paths.configFile, "{ not json");
    assert(ConfigLoader::Load(paths).targets.empty());

    test::WriteFile(paths.configFile, R"({"targets": "nope"})");
    assert(ConfigLoader::Load(paths).targets.empty());
}

void TestMistypedConfigField() {
    std::cout << "[Test] Config with a mistyped field..." << std::endl;
    test::TempDir dir("reflect_config_types");
    ReflectPaths paths = ReflectPaths::FromAgentDir(dir.path());

    test::WriteFile(paths.configFile, R"({"targets": [
        {"path": "~/a/AGENTS.md", "lookbackDays": 5},
        {"path": "~/b/AGENTS.md", "lookbackDays": "three", "model": 7, "maxSessionBytes": -1},
        {"path": "~/c/AGENTS.md", "schedule": "manual", "lookbackDays": 2.0}
    ]})");
    auto config = ConfigLoader::Load(paths);
    assert(config.targets.size() == 3);
    assert(config.targets[0].lookbackDays == 5);
    assert(config.targets[1].path == "~/b/AGENTS.md");
    assert(config.targets[1].lookbackDays == 1);
    assert(config.targets[1].model == "anthropic/claude-sonnet-4-5");
    assert(config.targets[1].maxSessionBytes == 600 * 1024);
    assert(config.targets[2].schedule == "manual");
    assert(config.targets[2].lookbackDays == 2);

    // A target whose path is unusable has nothing to point at, but its neighbours stay.
    test::WriteFile(paths.configFile, R"({"targets": [{"path": null}, {"path": "~/d/AGENTS.md"}]})");
    config = ConfigLoader::Load(paths);
    assert(!config.targets.empty());
    assert(config.targets.back().path == "~/d/AGENTS.md");
}

void TestConfigSaveLoad() {
    std::cout << "[Test] Config save and load..." << std::endl;
    test::TempDir dir("reflect_config_rt");
    ReflectPaths paths = ReflectPaths::FromAgentDir(dir.path() / "nested" / "agent");

    domain::ReflectTarget target = ConfigLoader::DefaultTarget(paths);
    target.path = "/work/SOUL.md";
    target.model = "ollama/llama3.1";
    target.transcriptSource.type = domain::TranscriptSourceType::Command;
    target.transcriptSource.command = "export-sessions --days {lookbackDays}";
    target.prompt = "Improve {fileName}";

    domain::ContextSource journal;
    journal.type = domain::ContextSourceType::Files;
    journal.label = "journal";
    journal.paths = {"~/journal/*.md"};
    journal.maxBytes = 2048;
    target.context.push_back(journal);

    domain::ContextSource feed;
    feed.type = domain::ContextSourceType::Url;
    feed.url = "http://localhost:8080/feed";
    target.transcripts.push_back(feed);

    domain::ReflectConfig config;
    config.targets.push_back(target);
    assert(ConfigLoader::Save(paths, config));

    json onDisk = json::parse(test::ReadFile(paths.configFile));
    assert(onDisk["targets"][0]["transcriptSource"]["type"] == "command");
    assert(onDisk["targets"][0]["context"][0]["type"] == "files");
    assert(onDisk["targets"][0]["transcripts"][0]["type"] == "url");

    auto loaded = ConfigLoader::Load(paths);
    assert(loaded.targets.size() == 1);
    const auto& t = loaded.targets[0];
    assert(t.path == "/work/SOUL.md");
    assert(t.model == "ollama/llama3.1");
    assert(t.transcriptSource.type == domain::TranscriptSourceType::Command);
    assert(t.transcriptSource.command == std::string("export-sessions --days {lookbackDays}"));
    assert(t.prompt == std::string("Improve {fileName}"));
    assert(t.context.size() == 1);
    assert(t.context[0].label == std::string("journal"));
    assert(t.context[0].paths.size() == 1);
    assert(t.context[0].maxBytes == std::size_t(2048));
    assert(t.transcripts.size() == 1);
    assert(t.transcripts[0].type == domain::ContextSourceType::Url);
    assert(!t.transcripts[0].label);
}

void TestFindTargetResolvesHome() {
    std::cout << "[Test] Target lookup..." << std::endl;
    test::TempDir home("reflect_home");
    setenv("HOME", home.str().c_str(), 1);

    assert(infrastructure::PathUtils::ResolvePath("~/notes/AGENTS.md") == (home.path() / "notes" / "AGENTS.md").string());

    domain::ReflectConfig config;
    domain::ReflectTarget a;
    a.path = "~/AGENTS.md";
    domain::ReflectTarget b;
    b.path = (home.path() / "SOUL.md").string();
    config.targets = {a, b};

    auto found = ConfigLoader::FindTarget(config, (home.path() / "AGENTS.md").string());
    assert(found && found->path == "~/AGENTS.md");
    found = ConfigLoader::FindTarget(config, "~/SOUL.md");
    assert(found && found->path == b.path);
    assert(!ConfigLoader::FindTarget(config, "~/OTHER.md"));
}

void TestHistoryCapAndFields() {
    std::cout << "[Test] History store..." << std::endl;
    test::TempDir dir("reflect_history");
    HistoryStore store((dir.path() / "sub" / "reflect-history.json").string());

    assert(store.load().empty());

    for (int i = 0; i < 105; ++i) {
        assert(store.append(MakeRun("run " + std::to_string(i))));
    }
    auto runs = store.load();
    assert(runs.size() == HistoryStore::kMaxRuns);
    assert(runs.front().summary == "run 5");
    assert(runs.back().summary == "run 104");
    assert(runs.back().correctionRate == 0.5);
    assert(runs.back().sourceDate.empty());

    json j = HistoryStore::RunToJson(MakeRun("x", {"Tools"}));
    assert(!j.contains("sourceDate"));
    assert(j["edits"][0]["type"] == "strengthen");
    assert(j["edits"][0]["section"] == "Tools");

    // Older batch runs carried only "date".
    auto legacy = HistoryStore::RunFromJson(json{{"timestamp", "t"}, {"date", "2026-01-10"}, {"editsApplied", 2}});
    assert(legacy.sourceDate == "2026-01-10");
    assert(legacy.editsApplied == 2);
    assert(legacy.edits.empty());

    auto current = HistoryStore::RunFromJson(json{{"sourceDate", "2026-01-11"}, {"date", "2026-01-10"}});
    assert(current.sourceDate == "2026-01-11");

    test::WriteFile(dir.path() / "broken.json", "[{");
    HistoryStore broken((dir.path() / "broken.json").string());
    assert(broken.load().empty());
}

void TestHistoryWithMistypedRecord() {
    std::cout << "[Test] History with a mistyped record..." << std::endl;
    test::TempDir dir("reflect_history_types");
    auto file = dir.path() / "reflect-history.json";
    HistoryStore store(file.string());

    json runs = json::array();
    runs.push_back(HistoryStore::RunToJson(MakeRun("first")));
    json odd = HistoryStore::RunToJson(MakeRun("odd"));
    odd["diffLines"] = nullptr;
    odd["date"] = 20260110;
    odd["correctionRate"] = nullptr;
    runs.push_back(odd);
    runs.push_back(HistoryStore::RunToJson(MakeRun("third")));
    test::WriteFile(file, runs.dump(2));

    auto loaded = store.load();
    assert(loaded.size() == 3);
    assert(loaded[1].summary == "odd");
    assert(loaded[1].diffLines == 0);
    assert(loaded[1].sourceDate.empty());
    assert(loaded[1].correctionRate == 0.0);
    assert(loaded[1].sessionsAnalyzed == 4);

    assert(store.append(MakeRun("fourth")));
    loaded = store.load();
    assert(loaded.size() == 4);
    assert(loaded.front().summary == "first");
    assert(loaded.back().summary == "fourth");
}

void TestUnreadableHistoryIsKept() {
    std::cout << "[Test] Unreadable history is not overwritten..." << std::endl;
    test::TempDir dir("reflect_history_unreadable");
    auto file = dir.path() / "reflect-history.json";
    HistoryStore store(file.string());

    const std::string damaged = "[{\"timestamp\": \"2026-01-16\", ";
    test::WriteFile(file, damaged);
    assert(store.load().empty());
    assert(!store.append(MakeRun("new")));
    assert(test::ReadFile(file) == damaged);

    test::WriteFile(file, R"({"runs": []})");
    assert(!store.append(MakeRun("new")));
    assert(test::ReadFile(file) == R"({"runs": []})");
}

void TestRecurringSections() {
    std::cout << "[Test] Recurring sections..." << std::endl;
    std::vector<domain::ReflectionRun> runs = {
        MakeRun("a", {"Communication", "Communication", "Tools"}),
        MakeRun("b", {"Communication"}),
        MakeRun("c", {"Code Changes", ""}),
        MakeRun("d", {"Code Changes"}),
        MakeRun("e", {"Code Changes"})
    };
    auto recurring = HistoryStore::RecurringSections(runs);
    assert(recurring.size() == 2);
    assert(recurring.at("Communication") == 2);
    assert(recurring.at("Code Changes") == 3);
    assert(recurring.count("Tools") == 0);
}

void TestTimeUtils() {
    std::cout << "[Test] Time helpers..." << std::endl;
    auto noon = std::chrono::system_clock::from_time_t(1768564800); // 2026-01-16T12:00:00Z

    std::string stamp = TimeUtils::FormatBackupTimestamp(noon);
    assert(stamp == "20260116_120000");
    assert(stamp.size() == 15);
    assert(TimeUtils::IsoTimestamp(noon + std::chrono::milliseconds(42)) == "2026-01-16T12:00:00.042Z");
    assert(TimeUtils::DateDaysAgo(1, noon) == "2026-01-15");
    assert(TimeUtils::DateDaysAgo(16, noon) == "2025-12-31");

    assert(TimeUtils::NextDay("2026-01-15") == std::string("2026-01-16"));
    assert(TimeUtils::NextDay("2026-01-31") == std::string("2026-02-01"));
    assert(TimeUtils::NextDay("2025-12-31") == std::string("2026-01-01"));
    assert(TimeUtils::NextDay("2024-02-28") == std::string("2024-02-29"));
    assert(!TimeUtils::NextDay("yesterday"));

    assert(TimeUtils::IsDate("2026-01-15"));
    assert(!TimeUtils::IsDate("2026-1-15"));
    assert(!TimeUtils::IsDate("2026/01/15"));
    assert(!TimeUtils::IsDate("2026-01-15T10"));
}

void TestDocumentRepository() {
    std::cout << "[Test] Document repository..." << std::endl;
    test::TempDir dir("reflect_docs");
    infrastructure::FileDocumentRepository repo;
    std::string doc = (dir.path() / "AGENTS.md").string();

    assert(infrastructure::FileDocumentRepository::BackupFileName("/a/b/AGENTS.md", "20260116_120000") == "AGENTS_20260116_120000.md");
    assert(infrastructure::FileDocumentRepository::BackupFileName("NOTES", "20260116_120000") == "NOTES_20260116_120000");

    assert(!repo.exists(doc));
    assert(!repo.read(doc));
    assert(repo.write(doc, test::SAMPLE_AGENTS_MD));
    assert(repo.exists(doc));
    assert(repo.read(doc) == test::SAMPLE_AGENTS_MD);

    auto backup = repo.createBackup(doc, (dir.path() / "backups").string());
    assert(backup);
    assert(test::ReadFile(*backup) == test::SAMPLE_AGENTS_MD);
    assert(repo.write(doc, "changed"));
    assert(test::ReadFile(*backup) == test::SAMPLE_AGENTS_MD);
    assert(repo.removeBackup(*backup));
    assert(!repo.exists(*backup));

    assert(!repo.createBackup((dir.path() / "missing.md").string(), (dir.path() / "backups").string()));
}

void TestSymlinkedDocument() {
    std::cout << "[Test] Symlinked document..." << std::endl;
    test::TempDir dir("reflect_symlink");
    infrastructure::FileDocumentRepository repo;
    auto real = dir.path() / "dotfiles" / "AGENTS.md";
    auto link = dir.path() / "project" / "AGENTS.md";
    test::WriteFile(real, "original rules\n");
    std::filesystem::create_directories(link.parent_path());
    std::filesystem::create_symlink(real, link);

    assert(repo.read(link.string()) == std::string("original rules\n"));
    assert(repo.write(link.string(), "edited rules\n"));
    assert(std::filesystem::is_symlink(link));
    assert(test::ReadFile(real) == "edited rules\n");
    assert(test::ReadFile(link) == "edited rules\n");

    // Backups copy the content, not the link.
    auto backup = repo.createBackup(link.string(), (dir.path() / "backups").string());
    assert(backup);
    assert(!std::filesystem::is_symlink(*backup));
    assert(test::ReadFile(*backup) == "edited rules\n");

    // No stray temp files next to either path.
    std::size_t entries = 0;
    for (const auto& e : std::filesystem::directory_iterator(real.parent_path())) { (void)e; ++entries; }
    assert(entries == 1);
    entries = 0;
    for (const auto& e : std::filesystem::directory_iterator(link.parent_path())) { (void)e; ++entries; }
    assert(entries == 1);
}

int main() {
    std::cout << "[Test] Starting Config and History Test..." << std::endl;

    TestConfigDefaultsAndMerge();
    TestMistypedConfigField();
    TestConfigSaveLoad();
    TestFindTargetResolvesHome();
    TestHistoryCapAndFields();
    TestHistoryWithMistypedRecord();
    TestUnreadableHistoryIsKept();
    TestRecurringSections();
    TestTimeUtils();
    TestDocumentRepository();
    TestSymlinkedDocument();

    std::cout << "[PASS] Config and History Test." << std::endl;
    return 0;
}
