/**
 * @file SessionLogReader.hpp
 * @brief Streaming reader that turns a JSONL session log into exchanges.
 */

#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <optional>
#include "domain/SessionExchange.hpp"

namespace reflect::infrastructure {

/**
 * @class SessionLogReader
 * @brief Lazy, single-pass sequence of exchanges read from one session log.
 *
 * Only "message" records from the user or the assistant are kept. Text and
 * thinking fragments are trimmed and joined with a newline; records with
 * neither are skipped, as are malformed lines. An unreadable file behaves as
 * an empty log.
 */
class SessionLogReader {
public:
    explicit SessionLogReader(const std::string& filepath);

    SessionLogReader(const SessionLogReader&) = delete;
    SessionLogReader& operator=(const SessionLogReader&) = delete;

    /** @brief Returns the next exchange in file order, or nullopt when the log is exhausted. */
    std::optional<domain::Exchange> next();

    /** @brief Drains the remaining sequence. */
    std::vector<domain::Exchange> readAll();

    /** @brief Convenience: reads a whole file. */
    static std::vector<domain::Exchange> Extract(const std::string& filepath);

    /** @brief Parses a single JSONL line. Exposed for tests. */
    static std::optional<domain::Exchange> ParseLine(const std::string& line);

private:
    std::ifstream m_stream;
    bool m_done = false;
};

} // namespace reflect::infrastructure
