#pragma once

#include <string>
#include <optional>
#include <chrono>
#include <nlohmann/json.hpp>

namespace watchlogs {

enum class EventKind : int {
    Line = 0,       // Appended content
    Backfill = 1,   // Pre-existing content emitted on attach
    Truncated = 2,  // File shrank in place
    Rotated = 3,    // Path now refers to a new file
    Missing = 4     // File disappeared, the watcher for it has ended
};

// Which decoder produced the text
enum class Decoding : int {
    Primary = 0,    // Valid UTF-8
    Fallback = 1    // Latin-1 re-encoded as UTF-8
};

inline std::string event_kind_to_string(EventKind k) {
    switch (k) {
        case EventKind::Line: return "line";
        case EventKind::Backfill: return "backfill";
        case EventKind::Truncated: return "truncated";
        case EventKind::Rotated: return "rotated";
        case EventKind::Missing: return "missing";
        default: return "unknown";
    }
}

inline EventKind string_to_event_kind(const std::string& s) {
    if (s == "backfill") return EventKind::Backfill;
    if (s == "truncated") return EventKind::Truncated;
    if (s == "rotated") return EventKind::Rotated;
    if (s == "missing") return EventKind::Missing;
    return EventKind::Line; // Default
}

inline double wall_clock_now() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration<double>(now.time_since_epoch()).count();
}

struct LineEvent {
    std::string path;                         // Resolved path of the watched file
    std::string text;                         // Decoded, newline stripped
    EventKind kind = EventKind::Line;
    std::optional<std::string> note;          // Notice text, or mtime for backfill
    Decoding decoding = Decoding::Primary;
    double timestamp = 0.0;                   // Unix time the event was produced

    bool is_notice() const {
        return kind == EventKind::Truncated || kind == EventKind::Rotated ||
               kind == EventKind::Missing;
    }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["path"] = path;
        j["text"] = text;
        j["kind"] = event_kind_to_string(kind);
        j["timestamp"] = timestamp;
        if (decoding == Decoding::Fallback) j["fallback_decoded"] = true;
        if (note) j["note"] = *note;
        return j;
    }

    static LineEvent from_json(const nlohmann::json& j) {
        LineEvent event;
        event.path = j.value("path", "");
        event.text = j.value("text", "");
        event.kind = string_to_event_kind(j.value("kind", "line"));
        event.timestamp = j.value("timestamp", 0.0);
        event.decoding = j.value("fallback_decoded", false) ? Decoding::Fallback
                                                            : Decoding::Primary;
        if (j.contains("note")) event.note = j["note"].get<std::string>();
        return event;
    }
};

// Staleness report for a file that produced nothing since the previous tick
struct IdleReport {
    std::string path;
    std::chrono::steady_clock::duration idle{};
    std::string last_line;

    double idle_seconds() const {
        return std::chrono::duration<double>(idle).count();
    }

    nlohmann::json to_json() const {
        return {
            {"path", path},
            {"kind", "idle"},
            {"idle_seconds", idle_seconds()},
            {"last_line", last_line}
        };
    }
};

} // namespace watchlogs
