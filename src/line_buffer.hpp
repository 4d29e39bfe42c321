#pragma once

#include "line_event.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstddef>

namespace watchlogs {

struct DecodedLine {
    std::string text;
    Decoding decoding = Decoding::Primary;
};

struct FeedResult {
    std::vector<DecodedLine> lines;   // Complete lines in the order they were written
    std::string remainder;            // Bytes after the last newline
};

// Reassembles lines from arbitrary byte chunks.
//
// The unterminated tail of each chunk is retained and prefixed to the next
// one, so the retained remainder never contains '\n'. A remainder that grows
// past max_line_bytes is force-emitted as a line so one runaway writer cannot
// hold unbounded memory.
class LineBuffer {
public:
    static constexpr std::size_t kDefaultMaxLineBytes = 1 << 20;

    explicit LineBuffer(std::size_t max_line_bytes = kDefaultMaxLineBytes);

    FeedResult feed(std::string_view chunk);

    // Emit the retained fragment as a final line, if any
    std::optional<DecodedLine> flush();

    // Drop the retained fragment (rotation/truncation)
    void clear() { remainder_.clear(); }

    const std::string& remainder() const { return remainder_; }
    bool has_remainder() const { return !remainder_.empty(); }

    // UTF-8 first, Latin-1 when the bytes are not valid UTF-8
    static DecodedLine decode(std::string_view bytes);
    static bool is_valid_utf8(std::string_view bytes);
    static std::string latin1_to_utf8(std::string_view bytes);

private:
    std::string remainder_;
    std::size_t max_line_bytes_;
};

} // namespace watchlogs
