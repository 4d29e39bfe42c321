#include "tail_engine.hpp"
#include "tail_log.hpp"
#include <filesystem>

namespace watchlogs {

TailEngine::TailEngine(OutputChannel& channel, EngineConfig config)
    : channel_(channel)
    , config_(std::move(config))
{
    config_.validate();
}

TailEngine::~TailEngine() {
    stop();

    std::map<std::string, std::shared_ptr<FileTailer>> tailers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tailers.swap(tailers_);
    }
    for (auto& [path, tailer] : tailers) {
        tailer->join();
    }
}

std::string TailEngine::resolve_path(const std::string& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return path;
    }
    auto resolved = std::filesystem::weakly_canonical(absolute, ec);
    if (ec) {
        return absolute.lexically_normal().string();
    }
    return resolved.string();
}

bool TailEngine::add_file(const std::string& path) {
    std::string resolved = resolve_path(path);

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tailers_.find(resolved);
    if (it != tailers_.end()) {
        if (it->second->state() != WatchState::Terminated) {
            TailLog::error("TailEngine", "Already watching: " + resolved);
            return false;
        }
        // A finished watcher for the same path can be replaced
        it->second->join();
        tailers_.erase(it);
    }

    auto tailer = std::make_shared<FileTailer>(channel_, resolved, config_);
    if (stopping_) {
        tailer->stop();
    }
    tailers_[resolved] = tailer;

    if (running_) {
        tailer->start();
    }
    return true;
}

bool TailEngine::remove_file(const std::string& path) {
    std::shared_ptr<FileTailer> tailer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tailers_.find(resolve_path(path));
        if (it == tailers_.end()) {
            return false;
        }
        tailer = it->second;
        tailers_.erase(it);
    }

    // An inline watcher is joined by run() returning, not here
    tailer->stop();
    tailer->join();
    return true;
}

std::vector<WatchInfo> TailEngine::list_files() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<WatchInfo> result;
    for (const auto& [path, tailer] : tailers_) {
        WatchInfo info;
        info.path = path;
        info.state = tailer->state();
        info.exit_reason = tailer->exit_reason();
        info.offset = tailer->offset();
        info.mode = tailer->mode();
        info.running = tailer->is_running();
        result.push_back(info);
    }
    return result;
}

std::size_t TailEngine::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tailers_.size();
}

void TailEngine::run() {
    std::vector<std::shared_ptr<FileTailer>> initial;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) return;
        running_ = true;
        for (auto& [path, tailer] : tailers_) {
            if (tailer->state() != WatchState::Terminated) {
                initial.push_back(tailer);
            }
        }
    }

    TailLog::log("TailEngine", "Following " + std::to_string(initial.size()) + " file(s)");

    if (initial.size() == 1) {
        initial.front()->run();
    } else {
        for (auto& tailer : initial) {
            tailer->start();
        }
    }

    // Files added while running have their own threads, wait for those too
    for (;;) {
        std::vector<std::shared_ptr<FileTailer>> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto& [path, tailer] : tailers_) {
                if (tailer->has_thread()) {
                    pending.push_back(tailer);
                }
            }
            if (pending.empty()) {
                running_ = false;
                break;
            }
        }
        for (auto& tailer : pending) {
            tailer->join();
        }
    }

    TailLog::log("TailEngine", "All watchers finished");
}

void TailEngine::stop() {
    stopping_ = true;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [path, tailer] : tailers_) {
        tailer->stop();
    }
}

} // namespace watchlogs
