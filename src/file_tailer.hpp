#pragma once

#include "engine_config.hpp"
#include "heartbeat_monitor.hpp"
#include "line_buffer.hpp"
#include "line_event.hpp"
#include "output_channel.hpp"
#include "tail_source.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace watchlogs {

// Attaching -> Streaming <-> Rotating/Truncating -> (Missing|Cancelled) -> Terminated
enum class WatchState : int {
    Attaching = 0,
    Streaming = 1,
    Rotating = 2,
    Truncating = 3,
    Missing = 4,
    Cancelled = 5,
    Terminated = 6
};

inline std::string watch_state_to_string(WatchState s) {
    switch (s) {
        case WatchState::Attaching: return "attaching";
        case WatchState::Streaming: return "streaming";
        case WatchState::Rotating: return "rotating";
        case WatchState::Truncating: return "truncating";
        case WatchState::Missing: return "missing";
        case WatchState::Cancelled: return "cancelled";
        case WatchState::Terminated: return "terminated";
        default: return "unknown";
    }
}

// Follows one file: owns its source, offset, line buffer and heartbeat.
// Nothing here is touched by other watchers; events leave through the channel.
class FileTailer {
public:
    FileTailer(OutputChannel& channel, const std::string& path, const EngineConfig& config);
    ~FileTailer();

    // Non-copyable
    FileTailer(const FileTailer&) = delete;
    FileTailer& operator=(const FileTailer&) = delete;

    // Attach, then follow until the file goes missing or the watcher is halted
    void run();

    // run() on a dedicated thread
    void start();

    // Request cooperative shutdown, observed at the next loop iteration
    void stop();
    void join();
    bool has_thread();

    bool is_running() const { return running_; }
    bool stop_requested() const { return stop_requested_; }
    WatchState state() const { return state_; }
    // Missing, Cancelled, or Terminated when the watcher failed
    WatchState exit_reason() const { return exit_reason_; }
    const std::string& path() const { return path_; }
    std::uint64_t offset() const { return offset_; }
    SourceMode mode() const { return mode_; }

private:
    bool attach();
    bool follow_once();
    bool check_halt();
    void handle(const SourceEvent& event, bool& missing);
    bool emit_line(EventKind kind, DecodedLine line,
                   std::optional<std::string> note = std::nullopt);
    void emit_notice(EventKind kind, const std::string& note);
    // Emit the unterminated tail of the file as a last line
    void flush_remainder();
    void end_missing(const std::string& note);
    void set_state(WatchState state) { state_ = state; }

    OutputChannel& channel_;
    std::string path_;
    EngineConfig config_;
    std::unique_ptr<TailSource> source_;
    LineBuffer buffer_;
    HeartbeatMonitor heartbeat_;
    std::chrono::steady_clock::time_point last_read_{};
    int missing_checks_ = 0;
    bool halted_ = false;

    std::thread thread_;
    std::mutex thread_mutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<WatchState> state_{WatchState::Attaching};
    std::atomic<WatchState> exit_reason_{WatchState::Terminated};
    std::atomic<std::uint64_t> offset_{0};
    std::atomic<SourceMode> mode_;
};

} // namespace watchlogs
