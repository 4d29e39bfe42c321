#include "line_archive.hpp"
#include <sstream>
#include <stdexcept>

namespace watchlogs {

namespace {

std::string column_text(sqlite3_stmt* stmt, int col) {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    if (!text) return std::string();
    // Lines may hold NUL bytes, take the stored length
    return std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(stmt, col)));
}

// Appends the WHERE conditions for a filter; bind_filter binds them in the same order
void append_conditions(std::ostringstream& sql, const ArchiveFilter& filter, const char* prefix) {
    if (filter.path) sql << " AND " << prefix << "path = ?";
    if (filter.kind) sql << " AND " << prefix << "kind = ?";
    if (filter.since) sql << " AND " << prefix << "timestamp >= ?";
    if (filter.until) sql << " AND " << prefix << "timestamp <= ?";
}

void bind_filter(sqlite3_stmt* stmt, const ArchiveFilter& filter, int idx) {
    if (filter.path) sqlite3_bind_text(stmt, idx++, filter.path->c_str(), -1, SQLITE_TRANSIENT);
    if (filter.kind) sqlite3_bind_int(stmt, idx++, static_cast<int>(*filter.kind));
    if (filter.since) sqlite3_bind_double(stmt, idx++, *filter.since);
    if (filter.until) sqlite3_bind_double(stmt, idx++, *filter.until);
}

} // namespace

LineArchive::LineArchive(const std::string& db_path) {
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string err = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open archive: " + err);
    }

    // Watchers insert from their own threads
    exec("PRAGMA journal_mode=WAL");
    exec("PRAGMA synchronous=NORMAL");

    init_schema();
}

LineArchive::~LineArchive() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void LineArchive::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string error_msg = err ? err : "Unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SQL error: " + error_msg);
    }
}

sqlite3_stmt* LineArchive::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }
    return stmt;
}

void LineArchive::init_schema() {
    exec(R"(
        CREATE TABLE IF NOT EXISTS lines (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            path TEXT NOT NULL,
            kind INTEGER NOT NULL,
            text TEXT NOT NULL,
            note TEXT,
            fallback INTEGER NOT NULL,
            timestamp REAL NOT NULL
        )
    )");

    exec("CREATE INDEX IF NOT EXISTS idx_lines_path ON lines(path)");
    exec("CREATE INDEX IF NOT EXISTS idx_lines_timestamp ON lines(timestamp)");

    exec(R"(
        CREATE VIRTUAL TABLE IF NOT EXISTS lines_fts USING fts5(
            text,
            content='lines',
            content_rowid='id'
        )
    )");

    exec(R"(
        CREATE TRIGGER IF NOT EXISTS lines_ai AFTER INSERT ON lines BEGIN
            INSERT INTO lines_fts(rowid, text) VALUES (new.id, new.text);
        END
    )");

    exec(R"(
        CREATE TRIGGER IF NOT EXISTS lines_ad AFTER DELETE ON lines BEGIN
            INSERT INTO lines_fts(lines_fts, rowid, text) VALUES('delete', old.id, old.text);
        END
    )");
}

int64_t LineArchive::insert(const LineEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = prepare(R"(
        INSERT INTO lines (path, kind, text, note, fallback, timestamp)
        VALUES (?, ?, ?, ?, ?, ?)
    )");

    double timestamp = event.timestamp != 0.0 ? event.timestamp : wall_clock_now();

    sqlite3_bind_text(stmt, 1, event.path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, static_cast<int>(event.kind));
    sqlite3_bind_text(stmt, 3, event.text.c_str(), static_cast<int>(event.text.size()), SQLITE_TRANSIENT);
    if (event.note) {
        sqlite3_bind_text(stmt, 4, event.note->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, 4);
    }
    sqlite3_bind_int(stmt, 5, event.decoding == Decoding::Fallback ? 1 : 0);
    sqlite3_bind_double(stmt, 6, timestamp);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to archive line: " + std::string(sqlite3_errmsg(db_)));
    }
    return sqlite3_last_insert_rowid(db_);
}

ArchivedLine LineArchive::row_to_line(sqlite3_stmt* stmt) {
    ArchivedLine line;
    line.id = sqlite3_column_int64(stmt, 0);
    line.event.path = column_text(stmt, 1);
    line.event.kind = static_cast<EventKind>(sqlite3_column_int(stmt, 2));
    line.event.text = column_text(stmt, 3);
    if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
        line.event.note = column_text(stmt, 4);
    }
    line.event.decoding = sqlite3_column_int(stmt, 5) ? Decoding::Fallback : Decoding::Primary;
    line.event.timestamp = sqlite3_column_double(stmt, 6);
    return line;
}

std::vector<ArchivedLine> LineArchive::query(const ArchiveFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ostringstream sql;
    sql << "SELECT id, path, kind, text, note, fallback, timestamp FROM lines WHERE 1=1";
    append_conditions(sql, filter, "");
    sql << " ORDER BY id ASC LIMIT " << filter.limit << " OFFSET " << filter.offset;

    sqlite3_stmt* stmt = prepare(sql.str());
    bind_filter(stmt, filter, 1);

    std::vector<ArchivedLine> results;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        results.push_back(row_to_line(stmt));
    }
    sqlite3_finalize(stmt);
    return results;
}

std::vector<ArchivedLine> LineArchive::search(const std::string& query, const ArchiveFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ostringstream sql;
    sql << R"(
        SELECT l.id, l.path, l.kind, l.text, l.note, l.fallback, l.timestamp
        FROM lines l
        JOIN lines_fts fts ON l.id = fts.rowid
        WHERE lines_fts MATCH ?
    )";
    append_conditions(sql, filter, "l.");
    sql << " ORDER BY l.id DESC LIMIT " << filter.limit << " OFFSET " << filter.offset;

    sqlite3_stmt* stmt = prepare(sql.str());
    sqlite3_bind_text(stmt, 1, query.c_str(), -1, SQLITE_TRANSIENT);
    bind_filter(stmt, filter, 2);

    std::vector<ArchivedLine> results;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        results.push_back(row_to_line(stmt));
    }
    sqlite3_finalize(stmt);
    return results;
}

int64_t LineArchive::count(std::optional<std::string> path) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = "SELECT COUNT(*) FROM lines";
    if (path) sql += " WHERE path = ?";

    sqlite3_stmt* stmt = prepare(sql);
    if (path) {
        sqlite3_bind_text(stmt, 1, path->c_str(), -1, SQLITE_TRANSIENT);
    }

    int64_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

std::vector<std::string> LineArchive::paths() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = prepare("SELECT DISTINCT path FROM lines ORDER BY path");

    std::vector<std::string> paths;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        paths.push_back(column_text(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return paths;
}

int64_t LineArchive::clear(std::optional<std::string> path, std::optional<double> before) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ostringstream sql;
    sql << "DELETE FROM lines WHERE 1=1";
    if (path) sql << " AND path = ?";
    if (before) sql << " AND timestamp < ?";

    sqlite3_stmt* stmt = prepare(sql.str());
    int idx = 1;
    if (path) sqlite3_bind_text(stmt, idx++, path->c_str(), -1, SQLITE_TRANSIENT);
    if (before) sqlite3_bind_double(stmt, idx++, *before);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to clear archive: " + std::string(sqlite3_errmsg(db_)));
    }
    return sqlite3_changes(db_);
}

} // namespace watchlogs
