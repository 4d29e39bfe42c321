#include <catch2/catch_test_macros.hpp>
#include "line_buffer.hpp"
#include <string>
#include <vector>

using namespace watchlogs;

namespace {

std::vector<std::string> texts(const FeedResult& result) {
    std::vector<std::string> out;
    for (const auto& line : result.lines) {
        out.push_back(line.text);
    }
    return out;
}

} // namespace

TEST_CASE("LineBuffer reassembles lines", "[line_buffer]") {
    LineBuffer buffer;

    SECTION("Split across two feeds") {
        auto first = buffer.feed("a\nb");
        REQUIRE(texts(first) == std::vector<std::string>{"a"});
        REQUIRE(first.remainder == "b");

        auto second = buffer.feed("c\nd");
        REQUIRE(texts(second) == std::vector<std::string>{"bc"});
        REQUIRE(second.remainder == "d");
        REQUIRE(buffer.remainder() == "d");
    }

    SECTION("Every split point of the same input gives the same lines") {
        const std::string input = "a\nbc\nd";
        for (std::size_t cut = 0; cut <= input.size(); ++cut) {
            LineBuffer split;
            std::vector<std::string> lines;
            for (auto& l : texts(split.feed(input.substr(0, cut)))) lines.push_back(l);
            for (auto& l : texts(split.feed(input.substr(cut)))) lines.push_back(l);
            REQUIRE(lines == std::vector<std::string>{"a", "bc"});
            REQUIRE(split.remainder() == "d");
        }
    }

    SECTION("Remainder is emitted once its newline arrives") {
        buffer.feed("partial");
        REQUIRE(buffer.has_remainder());
        auto result = buffer.feed(" line\n");
        REQUIRE(texts(result) == std::vector<std::string>{"partial line"});
        REQUIRE_FALSE(buffer.has_remainder());
    }

    SECTION("Byte at a time") {
        std::vector<std::string> lines;
        for (char c : std::string("xy\nz\n")) {
            for (auto& l : texts(buffer.feed(std::string(1, c)))) lines.push_back(l);
        }
        REQUIRE(lines == std::vector<std::string>{"xy", "z"});
    }

    SECTION("Empty lines are kept") {
        auto result = buffer.feed("\n\nend\n");
        REQUIRE(texts(result) == std::vector<std::string>{"", "", "end"});
    }

    SECTION("CRLF line endings are stripped") {
        auto result = buffer.feed("dos\r\nunix\n");
        REQUIRE(texts(result) == std::vector<std::string>{"dos", "unix"});
    }
}

TEST_CASE("LineBuffer empty feed is a no-op", "[line_buffer]") {
    LineBuffer buffer;
    buffer.feed("keep");

    auto result = buffer.feed("");
    REQUIRE(result.lines.empty());
    REQUIRE(result.remainder == "keep");
    REQUIRE(buffer.remainder() == "keep");
}

TEST_CASE("LineBuffer remainder never holds a newline", "[line_buffer]") {
    LineBuffer buffer;
    for (const char* chunk : {"one\ntw", "o\nthr", "ee", "\n", "four"}) {
        buffer.feed(chunk);
        REQUIRE(buffer.remainder().find('\n') == std::string::npos);
    }
    REQUIRE(buffer.remainder() == "four");
}

TEST_CASE("LineBuffer decode fallback", "[line_buffer][decode]") {
    LineBuffer buffer;

    SECTION("Valid UTF-8 uses the primary decoder") {
        auto result = buffer.feed("na\xc3\xafve \xe2\x9c\x93\n");
        REQUIRE(result.lines.size() == 1);
        REQUIRE(result.lines[0].decoding == Decoding::Primary);
        REQUIRE(result.lines[0].text == "na\xc3\xafve \xe2\x9c\x93");
    }

    SECTION("Undecodable bytes still produce exactly one line") {
        auto result = buffer.feed("caf\xe9\n");
        REQUIRE(result.lines.size() == 1);
        REQUIRE(result.lines[0].decoding == Decoding::Fallback);
        // Latin-1 0xE9 re-encoded as UTF-8
        REQUIRE(result.lines[0].text == "caf\xc3\xa9");
    }

    SECTION("A bad line does not affect its neighbours") {
        auto result = buffer.feed("ok\n\xff\xfe\nok again\n");
        REQUIRE(result.lines.size() == 3);
        REQUIRE(result.lines[0].decoding == Decoding::Primary);
        REQUIRE(result.lines[1].decoding == Decoding::Fallback);
        REQUIRE(result.lines[1].text == "\xc3\xbf\xc3\xbe");
        REQUIRE(result.lines[2].decoding == Decoding::Primary);
    }

    SECTION("Multi-byte character split across reads decodes as UTF-8") {
        buffer.feed("snow \xe2\x98");
        auto result = buffer.feed("\x83\n");
        REQUIRE(result.lines.size() == 1);
        REQUIRE(result.lines[0].decoding == Decoding::Primary);
        REQUIRE(result.lines[0].text == "snow \xe2\x98\x83");
    }
}

TEST_CASE("UTF-8 validation", "[line_buffer][decode]") {
    REQUIRE(LineBuffer::is_valid_utf8(""));
    REQUIRE(LineBuffer::is_valid_utf8("plain ascii"));
    REQUIRE(LineBuffer::is_valid_utf8("\xf0\x9f\x98\x80"));          // U+1F600

    REQUIRE_FALSE(LineBuffer::is_valid_utf8("\xc0\xaf"));            // Overlong '/'
    REQUIRE_FALSE(LineBuffer::is_valid_utf8("\xed\xa0\x80"));        // Surrogate
    REQUIRE_FALSE(LineBuffer::is_valid_utf8("\xf4\x90\x80\x80"));    // Past U+10FFFF
    REQUIRE_FALSE(LineBuffer::is_valid_utf8("\xe2\x98"));            // Truncated sequence
    REQUIRE_FALSE(LineBuffer::is_valid_utf8("\x80"));                // Stray continuation
}

TEST_CASE("LineBuffer bounds a runaway fragment", "[line_buffer]") {
    LineBuffer buffer(4);

    auto result = buffer.feed("abcdefghij");
    REQUIRE(texts(result) == std::vector<std::string>{"abcd", "efgh"});
    REQUIRE(buffer.remainder() == "ij");
}

TEST_CASE("LineBuffer flush and clear", "[line_buffer]") {
    LineBuffer buffer;

    SECTION("Flush emits the dangling fragment") {
        buffer.feed("done\nhalf");
        auto line = buffer.flush();
        REQUIRE(line.has_value());
        REQUIRE(line->text == "half");
        REQUIRE_FALSE(buffer.has_remainder());
        REQUIRE_FALSE(buffer.flush().has_value());
    }

    SECTION("Clear drops it") {
        buffer.feed("stale");
        buffer.clear();
        auto result = buffer.feed("fresh\n");
        REQUIRE(texts(result) == std::vector<std::string>{"fresh"});
    }
}
