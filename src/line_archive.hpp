#pragma once

#include "line_event.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace watchlogs {

struct ArchivedLine {
    int64_t id = 0;
    LineEvent event;
};

struct ArchiveFilter {
    std::optional<std::string> path;
    std::optional<EventKind> kind;
    std::optional<double> since;              // Timestamp >=
    std::optional<double> until;              // Timestamp <=
    int limit = 100;
    int offset = 0;
};

// SQLite record of every event that passed through the output channel
class LineArchive {
public:
    explicit LineArchive(const std::string& db_path);
    ~LineArchive();

    // Non-copyable
    LineArchive(const LineArchive&) = delete;
    LineArchive& operator=(const LineArchive&) = delete;

    // Returns the assigned ID
    int64_t insert(const LineEvent& event);

    // Oldest first, in the order events were archived
    std::vector<ArchivedLine> query(const ArchiveFilter& filter);

    // Full-text search over line text, newest first
    std::vector<ArchivedLine> search(const std::string& query, const ArchiveFilter& filter);

    int64_t count(std::optional<std::string> path = std::nullopt);

    // Distinct archived paths
    std::vector<std::string> paths();

    // Delete matching rows, returns how many went
    int64_t clear(std::optional<std::string> path = std::nullopt,
                  std::optional<double> before = std::nullopt);

private:
    void init_schema();
    void exec(const std::string& sql);
    sqlite3_stmt* prepare(const std::string& sql);
    ArchivedLine row_to_line(sqlite3_stmt* stmt);

    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

} // namespace watchlogs
