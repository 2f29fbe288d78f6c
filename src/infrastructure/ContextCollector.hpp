/**
 * @file ContextCollector.hpp
 * @brief Reads auxiliary context (files, commands, URLs) for the reflection prompt.
 */

#pragma once
#include <string>
#include <vector>
#include <functional>
#include <optional>
#include "domain/ReflectTarget.hpp"

namespace reflect::infrastructure {

/**
 * @class ContextCollector
 * @brief Renders every non-empty source as "## <label>\n<content>", joined by "\n\n---\n\n".
 *
 * Each source is capped at its maxBytes (100 KB by default) and marked when cut.
 * File sources accept plain paths and globs with "*" in the file name; files
 * whose name carries a date older than the lookback cutoff are skipped, and the
 * newest names are read first until the cap is reached.
 */
class ContextCollector {
public:
    using UrlFetcher = std::function<std::optional<std::string>(const std::string& url)>;

    /** @param fetcher HTTP GET used for url sources; defaults to cpp-httplib. */
    explicit ContextCollector(UrlFetcher fetcher = nullptr);

    std::string collect(const std::vector<domain::ContextSource>& sources, int lookbackDays) const;

    /** @brief HTTP GET with a 15 second timeout; nullopt unless the server answers 2xx. */
    static std::optional<std::string> HttpGet(const std::string& url);

    /** @brief True when the name has no YYYY-MM-DD date, or the date is on or after the cutoff. */
    static bool IsWithinLookback(const std::string& filename, const std::string& cutoff);

private:
    std::string readFiles(const domain::ContextSource& source, int lookbackDays, std::size_t maxBytes) const;

    UrlFetcher m_fetcher;
};

} // namespace reflect::infrastructure
