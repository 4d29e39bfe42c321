#include "tail_log.hpp"
#include <ctime>
#include <iomanip>
#include <iostream>

namespace watchlogs {

TailLog::Sink TailLog::sink_ = TailLog::stream_sink;
std::atomic<bool> TailLog::verbose_{false};
std::mutex TailLog::mutex_;

void TailLog::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink) {
        sink_ = std::move(sink);
    } else {
        sink_ = stream_sink;
    }
}

void TailLog::write(Level level, const std::string& component, const std::string& message) {
    if (level == Level::Debug && !verbose_) return;

    // Held across the call so two watchers never interleave inside the sink
    std::lock_guard<std::mutex> lock(mutex_);
    sink_(component, message, level == Level::Error);
}

void TailLog::stream_sink(const std::string& component,
                          const std::string& message, bool is_error) {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);

    std::ostream& out = is_error ? std::cerr : std::clog;
    out << std::put_time(&tm, "%H:%M:%S") << " [" << component << "] " << message << std::endl;
}

} // namespace watchlogs
