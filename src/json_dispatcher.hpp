#pragma once

#include "line_event.hpp"
#include "output_channel.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <ostream>

namespace watchlogs {

// One JSON object per line event / idle report, for piping into other tools
class JsonDispatcher {
public:
    explicit JsonDispatcher(std::ostream& out)
        : out_(out)
    {
    }

    void attach(OutputChannel& channel) {
        channel.subscribe([this](const LineEvent& event) {
            write(event.to_json());
        });
        channel.subscribe_idle([this](const IdleReport& report) {
            write(report.to_json());
        });
    }

    void write(const nlohmann::json& j) {
        std::lock_guard<std::mutex> lock(mutex_);
        // Paths are not guaranteed to be UTF-8
        out_ << j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    }

private:
    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace watchlogs
