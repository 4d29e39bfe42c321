#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace watchlogs {

// Diagnostics about the watchers themselves, kept apart from followed lines.
// One sink for the whole process; the console dispatcher installs its own so
// diagnostics and lines share one writer.
class TailLog {
public:
    enum class Level {
        Debug,      // Only with set_verbose(true)
        Info,
        Error
    };

    using Sink = std::function<void(const std::string& component,
                                     const std::string& message,
                                     bool is_error)>;

    // nullptr restores stream_sink
    static void set_sink(Sink sink);
    static void set_verbose(bool verbose) { verbose_ = verbose; }

    static void log(const std::string& component, const std::string& message) {
        write(Level::Info, component, message);
    }
    static void error(const std::string& component, const std::string& message) {
        write(Level::Error, component, message);
    }
    static void debug(const std::string& component, const std::string& message) {
        write(Level::Debug, component, message);
    }

    static void write(Level level, const std::string& component, const std::string& message);

    // "HH:MM:SS [component] message", errors to stderr, the rest to clog
    static void stream_sink(const std::string& component,
                            const std::string& message, bool is_error);

private:
    static Sink sink_;
    static std::atomic<bool> verbose_;
    static std::mutex mutex_;
};

} // namespace watchlogs
