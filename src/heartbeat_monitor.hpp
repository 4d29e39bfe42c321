#pragma once

#include "line_event.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace watchlogs {

// Tracks how long a watched file has gone without producing a line.
// Only observes; the tailer calls it between reads.
class HeartbeatMonitor {
public:
    using Clock = std::chrono::steady_clock;

    HeartbeatMonitor(std::string path, Clock::duration cadence,
                     Clock::time_point start = Clock::now());

    // A line was emitted; resets the idle clock
    void record(const std::string& line, Clock::time_point now = Clock::now());

    // Once per cadence: an idle report when nothing was emitted since the
    // previous tick, nullopt otherwise (or when the cadence has not elapsed)
    std::optional<IdleReport> tick(Clock::time_point now = Clock::now());

    Clock::duration idle(Clock::time_point now = Clock::now()) const { return now - last_activity_; }

private:
    std::string path_;
    Clock::duration cadence_;
    std::string last_line_;
    Clock::time_point last_activity_;
    Clock::time_point next_tick_;
    std::uint64_t emitted_since_tick_ = 0;
};

} // namespace watchlogs
