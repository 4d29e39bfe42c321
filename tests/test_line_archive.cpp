#include <catch2/catch_test_macros.hpp>
#include "line_archive.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <stdexcept>

using namespace watchlogs;
using namespace watchlogs::testing;

namespace {

LineEvent make_event(const std::string& path, const std::string& text, double timestamp,
                     EventKind kind = EventKind::Line) {
    LineEvent event;
    event.path = path;
    event.text = text;
    event.kind = kind;
    event.timestamp = timestamp;
    return event;
}

} // namespace

TEST_CASE("LineArchive basic operations", "[archive]") {
    TempDir dir;
    LineArchive archive(dir.file("archive.db"));

    SECTION("Insert and query lines") {
        int64_t id = archive.insert(make_event("/var/log/app.log", "Started worker", 1000.0));
        REQUIRE(id > 0);

        auto lines = archive.query(ArchiveFilter{});
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].id == id);
        REQUIRE(lines[0].event.path == "/var/log/app.log");
        REQUIRE(lines[0].event.text == "Started worker");
        REQUIRE(lines[0].event.kind == EventKind::Line);
        REQUIRE_FALSE(lines[0].event.note.has_value());
    }

    SECTION("Lines come back in archive order") {
        archive.insert(make_event("/a.log", "first", 3000.0));
        archive.insert(make_event("/a.log", "second", 1000.0));
        archive.insert(make_event("/a.log", "third", 2000.0));

        auto lines = archive.query(ArchiveFilter{});
        REQUIRE(lines.size() == 3);
        REQUIRE(lines[0].event.text == "first");
        REQUIRE(lines[1].event.text == "second");
        REQUIRE(lines[2].event.text == "third");
    }

    SECTION("Filter by path and kind") {
        archive.insert(make_event("/a.log", "from a", 1000.0));
        archive.insert(make_event("/b.log", "from b", 1001.0));
        archive.insert(make_event("/b.log", "", 1002.0, EventKind::Truncated));

        ArchiveFilter filter;
        filter.path = "/b.log";
        auto lines = archive.query(filter);
        REQUIRE(lines.size() == 2);
        for (const auto& line : lines) {
            REQUIRE(line.event.path == "/b.log");
        }

        filter.kind = EventKind::Truncated;
        lines = archive.query(filter);
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].event.kind == EventKind::Truncated);
    }

    SECTION("Filter by time range with paging") {
        for (int i = 0; i < 10; ++i) {
            archive.insert(make_event("/a.log", "line " + std::to_string(i), 1000.0 + i));
        }

        ArchiveFilter filter;
        filter.since = 1002.0;
        filter.until = 1007.0;
        REQUIRE(archive.query(filter).size() == 6);

        filter.limit = 2;
        filter.offset = 1;
        auto page = archive.query(filter);
        REQUIRE(page.size() == 2);
        REQUIRE(page[0].event.text == "line 3");
        REQUIRE(page[1].event.text == "line 4");
    }

    SECTION("Notes and decoding survive storage") {
        auto backfill = make_event("/a.log", "caf\xc3\xa9", 1000.0, EventKind::Backfill);
        backfill.note = "Mon Mar  4 10:00:00 2024";
        backfill.decoding = Decoding::Fallback;
        archive.insert(backfill);

        auto lines = archive.query(ArchiveFilter{});
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].event.kind == EventKind::Backfill);
        REQUIRE(lines[0].event.note.has_value());
        REQUIRE(*lines[0].event.note == "Mon Mar  4 10:00:00 2024");
        REQUIRE(lines[0].event.decoding == Decoding::Fallback);
        REQUIRE(lines[0].event.text == "caf\xc3\xa9");
    }

    SECTION("Embedded NUL bytes survive storage") {
        std::string text("before\0after", 12);
        archive.insert(make_event("/a.log", text, 1000.0));

        auto lines = archive.query(ArchiveFilter{});
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].event.text.size() == 12);
        REQUIRE(lines[0].event.text == text);
    }

    SECTION("Missing timestamp is filled in") {
        archive.insert(make_event("/a.log", "now", 0.0));
        auto lines = archive.query(ArchiveFilter{});
        REQUIRE(lines[0].event.timestamp > 0.0);
    }

    SECTION("Full-text search") {
        archive.insert(make_event("/a.log", "Connection refused by upstream", 2000.0));
        archive.insert(make_event("/a.log", "Request completed", 2001.0));
        archive.insert(make_event("/b.log", "Upstream connection restored", 2002.0));

        auto results = archive.search("connection", ArchiveFilter{});
        REQUIRE(results.size() == 2);
        // Newest first
        REQUIRE(results[0].event.text == "Upstream connection restored");
        REQUIRE(results[1].event.text == "Connection refused by upstream");

        ArchiveFilter filter;
        filter.path = "/a.log";
        results = archive.search("connection", filter);
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].event.path == "/a.log");
    }

    SECTION("Count and paths") {
        archive.insert(make_event("/b.log", "one", 1000.0));
        archive.insert(make_event("/a.log", "two", 1001.0));
        archive.insert(make_event("/a.log", "three", 1002.0));

        REQUIRE(archive.count() == 3);
        REQUIRE(archive.count(std::string("/a.log")) == 2);
        REQUIRE(archive.paths() == std::vector<std::string>{"/a.log", "/b.log"});
    }

    SECTION("Clear") {
        archive.insert(make_event("/a.log", "old", 1000.0));
        archive.insert(make_event("/a.log", "new", 5000.0));
        archive.insert(make_event("/b.log", "other", 1000.0));

        REQUIRE(archive.clear(std::string("/a.log"), 2000.0) == 1);
        REQUIRE(archive.count() == 2);
        REQUIRE(archive.search("old", ArchiveFilter{}).empty());

        REQUIRE(archive.clear() == 2);
        REQUIRE(archive.count() == 0);
    }
}

TEST_CASE("LineArchive persists across reopen", "[archive]") {
    TempDir dir;
    auto db_path = dir.file("archive.db");

    {
        LineArchive archive(db_path);
        archive.insert(make_event("/a.log", "kept", 1000.0));
    }

    LineArchive reopened(db_path);
    REQUIRE(reopened.count() == 1);
    REQUIRE(reopened.search("kept", ArchiveFilter{}).size() == 1);
}

TEST_CASE("LineArchive rejects an unusable path", "[archive]") {
    TempDir dir;
    REQUIRE_THROWS_AS(LineArchive(dir.file("no/such/dir/archive.db")), std::runtime_error);
}
