#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace watchlogs {

// How a watcher learns that its file changed
enum class SourceMode : int {
    Auto = 0,       // inotify when available, polling otherwise
    Notify = 1,     // inotify only, fail if unavailable
    Poll = 2        // stat + read on every interval
};

inline std::string source_mode_to_string(SourceMode m) {
    switch (m) {
        case SourceMode::Auto: return "auto";
        case SourceMode::Notify: return "notify";
        case SourceMode::Poll: return "poll";
        default: return "unknown";
    }
}

// Throws std::invalid_argument for anything but auto/notify/poll
SourceMode string_to_source_mode(const std::string& s);

// Longest accepted poll/heartbeat interval, in seconds
constexpr double kMaxIntervalSeconds = 24 * 60 * 60;

struct EngineConfig {
    double poll_interval = 0.2;               // Seconds between checks, 0 disables throttling
    int backfill_lines = -1;                  // Lines replayed on attach, -1 for the whole file
    bool heartbeat_enabled = false;
    double heartbeat_interval = 1.0;          // Seconds between idle reports
    SourceMode mode = SourceMode::Auto;
    int missing_retries = 2;                  // Extra checks before a missing file ends its watcher
    std::size_t read_block_size = 64 * 1024;
    std::size_t max_line_bytes = 1 << 20;

    // Checked once per loop iteration by every watcher; true halts them all
    std::function<bool()> halting;

    std::chrono::milliseconds poll_interval_ms() const;
    std::chrono::milliseconds heartbeat_interval_ms() const;

    // Throws std::invalid_argument on out of range values
    void validate() const;

    nlohmann::json to_json() const;

    // Missing keys keep their defaults
    static EngineConfig from_json(const nlohmann::json& j);
};

// Read a JSON config file. Throws std::runtime_error when it cannot be read or parsed.
EngineConfig load_config(const std::string& path);

} // namespace watchlogs
