#pragma once

#include "line_event.hpp"
#include "output_channel.hpp"
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace watchlogs::testing {

using namespace std::chrono_literals;

// Scratch directory removed with everything in it on destruction
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("watchlogs_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string file(const std::string& name) const { return (path_ / name).string(); }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline void append_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::app);
    out << content;
}

// Records everything delivered through a channel
class EventCollector {
public:
    explicit EventCollector(OutputChannel& channel) {
        channel.subscribe([this](const LineEvent& event) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
            cv_.notify_all();
        });
        channel.subscribe_idle([this](const IdleReport& report) {
            std::lock_guard<std::mutex> lock(mutex_);
            idle_.push_back(report);
            cv_.notify_all();
        });
    }

    std::vector<LineEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::vector<LineEvent> events_of(EventKind kind) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<LineEvent> result;
        for (const auto& e : events_) {
            if (e.kind == kind) result.push_back(e);
        }
        return result;
    }

    std::vector<std::string> texts(EventKind kind, const std::string& path = "") const {
        std::vector<std::string> result;
        for (const auto& e : events_of(kind)) {
            if (path.empty() || e.path == path) result.push_back(e.text);
        }
        return result;
    }

    std::vector<IdleReport> idle_reports(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<IdleReport> result;
        for (const auto& r : idle_) {
            if (r.path == path) result.push_back(r);
        }
        return result;
    }

    std::size_t count(EventKind kind) const { return events_of(kind).size(); }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

    bool wait_for_count(EventKind kind, std::size_t n,
                        std::chrono::milliseconds timeout = 5000ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() {
            std::size_t c = 0;
            for (const auto& e : events_) {
                if (e.kind == kind) ++c;
            }
            return c >= n;
        });
    }

    bool wait_for_idle(const std::string& path, std::size_t n,
                       std::chrono::milliseconds timeout = 5000ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() {
            std::size_t c = 0;
            for (const auto& r : idle_) {
                if (r.path == path) ++c;
            }
            return c >= n;
        });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<LineEvent> events_;
    std::vector<IdleReport> idle_;
};

// Poll a condition until it holds or the timeout expires
template<typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 5000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace watchlogs::testing
