#include "output_channel.hpp"

namespace watchlogs {

void OutputChannel::subscribe(LineCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    line_subscribers_.push_back(std::move(callback));
}

void OutputChannel::subscribe_idle(IdleCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_subscribers_.push_back(std::move(callback));
}

void OutputChannel::deliver(const LineEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& callback : line_subscribers_) {
        callback(event);
    }
    lines_delivered_++;
}

void OutputChannel::deliver(const IdleReport& report) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& callback : idle_subscribers_) {
        callback(report);
    }
}

} // namespace watchlogs
