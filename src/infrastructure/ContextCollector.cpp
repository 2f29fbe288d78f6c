/**
 * @file ContextCollector.cpp
 * @brief Implementation of ContextCollector.
 */

#include "infrastructure/ContextCollector.hpp"
#include "infrastructure/CommandRunner.hpp"
#include "infrastructure/CommandEvidenceSource.hpp"
#include "infrastructure/TimeUtils.hpp"
#include "domain/TextUtils.hpp"
#include <httplib.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace reflect::infrastructure {

namespace {

struct Candidate {
    std::string name;
    fs::path full;
};

std::string LabelFor(const domain::ContextSource& source) {
    if (source.label) return *source.label;
    switch (source.type) {
        case domain::ContextSourceType::Files: return "files";
        case domain::ContextSourceType::Command: return "command";
        case domain::ContextSourceType::Url: return "url";
    }
    return "files";
}

std::regex GlobToRegex(const std::string& pattern) {
    std::string re = "^";
    for (char c : pattern) {
        if (c == '*') {
            re += ".*";
        } else if (std::string(".^$|()[]{}+?\\").find(c) != std::string::npos) {
            re += '\\';
            re += c;
        } else {
            re += c;
        }
    }
    re += "$";
    return std::regex(re);
}

std::optional<std::string> ReadWholeFile(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return std::nullopt;
    std::stringstream buffer;
    buffer << f.rdbuf();
    return buffer.str();
}

} // namespace

ContextCollector::ContextCollector(UrlFetcher fetcher)
    : m_fetcher(fetcher ? std::move(fetcher) : UrlFetcher(&ContextCollector::HttpGet)) {}

bool ContextCollector::IsWithinLookback(const std::string& filename, const std::string& cutoff) {
    static const std::regex datePattern("(\\d{4}-\\d{2}-\\d{2})");
    std::smatch match;
    if (!std::regex_search(filename, match, datePattern)) return true;
    return match[1].str() >= cutoff;
}

std::optional<std::string> ContextCollector::HttpGet(const std::string& url) {
    size_t schemeEnd = url.find("://");
    size_t pathStart = url.find('/', schemeEnd == std::string::npos ? 0 : schemeEnd + 3);
    std::string base = pathStart == std::string::npos ? url : url.substr(0, pathStart);
    std::string path = pathStart == std::string::npos ? "/" : url.substr(pathStart);

    httplib::Client cli(base);
    cli.set_connection_timeout(15);
    cli.set_read_timeout(15);
    cli.set_follow_location(true);

    auto res = cli.Get(path);
    if (res && res->status >= 200 && res->status < 300) {
        return res->body;
    }
    if (res) {
        std::cerr << "[ContextCollector] HTTP Error " << res->status << " for " << url << std::endl;
    } else {
        std::cerr << "[ContextCollector] Connection failed for " << url << ": " << httplib::to_string(res.error()) << std::endl;
    }
    return std::nullopt;
}

std::string ContextCollector::readFiles(const domain::ContextSource& source, int lookbackDays, std::size_t maxBytes) const {
    const std::string cutoff = TimeUtils::DateDaysAgo(lookbackDays);
    std::vector<std::string> fileParts;
    std::size_t totalBytes = 0;

    for (const auto& pattern : source.paths) {
        std::string expanded = domain::ReplaceAll(pattern, "{lookbackDays}", std::to_string(lookbackDays));
        std::vector<Candidate> candidates;
        std::error_code ec;

        if (expanded.find('*') != std::string::npos) {
            fs::path p(expanded);
            fs::path dir = p.has_parent_path() ? p.parent_path() : fs::path(".");
            std::regex re = GlobToRegex(p.filename().string());
            for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
                std::string name = it->path().filename().string();
                if (std::regex_match(name, re)) {
                    candidates.push_back({name, it->path()});
                }
            }
        } else if (fs::exists(expanded, ec)) {
            candidates.push_back({fs::path(expanded).filename().string(), fs::path(expanded)});
        }

        candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                        [&cutoff](const Candidate& c) { return !IsWithinLookback(c.name, cutoff); }),
                         candidates.end());
        std::sort(candidates.begin(), candidates.end(),
                  [](const Candidate& a, const Candidate& b) { return a.name > b.name; });

        for (const auto& c : candidates) {
            if (!fs::is_regular_file(c.full, ec)) continue;
            auto content = ReadWholeFile(c.full);
            if (!content) continue;
            if (totalBytes + content->size() > maxBytes) break;
            fileParts.push_back("### " + c.name + "\n" + *content);
            totalBytes += content->size();
        }
    }

    std::string joined;
    for (size_t i = 0; i < fileParts.size(); ++i) {
        if (i > 0) joined += "\n\n";
        joined += fileParts[i];
    }
    return joined;
}

std::string ContextCollector::collect(const std::vector<domain::ContextSource>& sources, int lookbackDays) const {
    std::vector<std::string> parts;

    for (const auto& source : sources) {
        const std::size_t maxBytes = source.maxBytes.value_or(domain::ContextSource::kDefaultMaxBytes);
        std::string content;

        switch (source.type) {
            case domain::ContextSourceType::Files:
                content = readFiles(source, lookbackDays, maxBytes);
                break;
            case domain::ContextSourceType::Command:
                if (source.command) {
                    std::string cmd = domain::ReplaceAll(*source.command, "{lookbackDays}", std::to_string(lookbackDays));
                    auto result = CommandRunner::Run(cmd, maxBytes * 2);
                    if (result.success) content = result.output;
                }
                break;
            case domain::ContextSourceType::Url:
                if (source.url) {
                    std::string url = domain::ReplaceAll(*source.url, "{lookbackDays}", std::to_string(lookbackDays));
                    content = m_fetcher(url).value_or("");
                }
                break;
        }

        if (content.empty()) continue;
        if (content.size() > maxBytes) {
            content = content.substr(0, maxBytes) + CommandEvidenceSource::kTruncationMarker;
        }
        parts.push_back("## " + LabelFor(source) + "\n" + content);
    }

    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) joined += "\n\n---\n\n";
        joined += parts[i];
    }
    return joined;
}

} // namespace reflect::infrastructure
