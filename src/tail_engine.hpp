#pragma once

#include "engine_config.hpp"
#include "file_tailer.hpp"
#include "output_channel.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace watchlogs {

struct WatchInfo {
    std::string path;
    WatchState state = WatchState::Attaching;
    WatchState exit_reason = WatchState::Terminated;
    std::uint64_t offset = 0;
    SourceMode mode = SourceMode::Auto;
    bool running = false;

    nlohmann::json to_json() const {
        nlohmann::json j = {
            {"path", path},
            {"state", watch_state_to_string(state)},
            {"offset", offset},
            {"mode", source_mode_to_string(mode)},
            {"running", running}
        };
        if (state == WatchState::Terminated) {
            j["exit_reason"] = watch_state_to_string(exit_reason);
        }
        return j;
    }
};

// The watch set. One FileTailer per resolved path, each on its own thread
// (a lone file runs on the caller's thread). run() returns once every watcher
// has terminated.
class TailEngine {
public:
    TailEngine(OutputChannel& channel, EngineConfig config);
    ~TailEngine();

    // Non-copyable
    TailEngine(const TailEngine&) = delete;
    TailEngine& operator=(const TailEngine&) = delete;

    // Register a path. Returns false if it is already being watched.
    // While running, the new watcher starts immediately.
    bool add_file(const std::string& path);

    // Stop and forget one watcher. Returns false for an unknown path.
    bool remove_file(const std::string& path);

    std::vector<WatchInfo> list_files() const;
    std::size_t size() const;

    // Blocks until all watchers have terminated
    void run();

    // Ask every watcher to stop; run() returns within one polling interval
    void stop();

    bool is_running() const { return running_; }
    const EngineConfig& config() const { return config_; }

    // Absolute path with symlinks and dot segments resolved
    static std::string resolve_path(const std::string& path);

private:
    OutputChannel& channel_;
    EngineConfig config_;
    std::map<std::string, std::shared_ptr<FileTailer>> tailers_;
    mutable std::mutex mutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
};

} // namespace watchlogs
