#include "line_buffer.hpp"
#include <cstdint>

namespace watchlogs {

LineBuffer::LineBuffer(std::size_t max_line_bytes)
    : max_line_bytes_(max_line_bytes == 0 ? kDefaultMaxLineBytes : max_line_bytes)
{
}

FeedResult LineBuffer::feed(std::string_view chunk) {
    FeedResult result;
    if (chunk.empty()) {
        result.remainder = remainder_;
        return result;
    }

    std::size_t start = 0;
    while (start < chunk.size()) {
        auto nl = chunk.find('\n', start);
        if (nl == std::string_view::npos) {
            remainder_.append(chunk.substr(start));
            break;
        }

        std::string line;
        line.swap(remainder_);
        line.append(chunk.substr(start, nl - start));
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        result.lines.push_back(decode(line));
        start = nl + 1;
    }

    while (remainder_.size() > max_line_bytes_) {
        result.lines.push_back(decode(std::string_view(remainder_).substr(0, max_line_bytes_)));
        remainder_.erase(0, max_line_bytes_);
    }

    result.remainder = remainder_;
    return result;
}

std::optional<DecodedLine> LineBuffer::flush() {
    if (remainder_.empty()) {
        return std::nullopt;
    }
    auto line = decode(remainder_);
    remainder_.clear();
    return line;
}

DecodedLine LineBuffer::decode(std::string_view bytes) {
    DecodedLine line;
    if (is_valid_utf8(bytes)) {
        line.text.assign(bytes.data(), bytes.size());
        line.decoding = Decoding::Primary;
    } else {
        line.text = latin1_to_utf8(bytes);
        line.decoding = Decoding::Fallback;
    }
    return line;
}

bool LineBuffer::is_valid_utf8(std::string_view bytes) {
    const auto* p = reinterpret_cast<const unsigned char*>(bytes.data());
    const std::size_t n = bytes.size();
    std::size_t i = 0;

    while (i < n) {
        unsigned char c = p[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        std::size_t len;
        uint32_t cp;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }

        if (i + len > n) {
            return false;
        }
        for (std::size_t k = 1; k < len; ++k) {
            if ((p[i + k] & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (p[i + k] & 0x3F);
        }

        // Overlong forms, UTF-16 surrogates and values past U+10FFFF
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000) || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

std::string LineBuffer::latin1_to_utf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (char ch : bytes) {
        auto c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return out;
}

} // namespace watchlogs
