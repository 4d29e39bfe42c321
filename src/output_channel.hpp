#pragma once

#include "line_event.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace watchlogs {

// The one resource all watchers share. Delivery is serialized: subscribers see
// one event at a time, so lines from different files never interleave mid-write.
// Subscribers must not subscribe or deliver from inside a callback.
class OutputChannel {
public:
    using LineCallback = std::function<void(const LineEvent&)>;
    using IdleCallback = std::function<void(const IdleReport&)>;

    OutputChannel() = default;

    // Non-copyable
    OutputChannel(const OutputChannel&) = delete;
    OutputChannel& operator=(const OutputChannel&) = delete;

    void subscribe(LineCallback callback);
    void subscribe_idle(IdleCallback callback);

    void deliver(const LineEvent& event);
    void deliver(const IdleReport& report);

    std::uint64_t lines_delivered() const { return lines_delivered_; }

private:
    std::mutex mutex_;
    std::vector<LineCallback> line_subscribers_;
    std::vector<IdleCallback> idle_subscribers_;
    std::atomic<std::uint64_t> lines_delivered_{0};
};

} // namespace watchlogs
