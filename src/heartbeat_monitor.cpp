#include "heartbeat_monitor.hpp"

namespace watchlogs {

HeartbeatMonitor::HeartbeatMonitor(std::string path, Clock::duration cadence,
                                   Clock::time_point start)
    : path_(std::move(path))
    , cadence_(cadence)
    , last_activity_(start)
    , next_tick_(start + cadence)
{
}

void HeartbeatMonitor::record(const std::string& line, Clock::time_point now) {
    last_line_ = line;
    last_activity_ = now;
    ++emitted_since_tick_;
}

std::optional<IdleReport> HeartbeatMonitor::tick(Clock::time_point now) {
    if (now < next_tick_) {
        return std::nullopt;
    }
    next_tick_ = now + cadence_;

    if (emitted_since_tick_ > 0) {
        emitted_since_tick_ = 0;
        return std::nullopt;
    }

    IdleReport report;
    report.path = path_;
    report.idle = idle(now);
    report.last_line = last_line_;
    return report;
}

} // namespace watchlogs
