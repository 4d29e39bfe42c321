#include "engine_config.hpp"
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <stdexcept>

namespace watchlogs {

namespace {

std::chrono::milliseconds seconds_to_ms(double seconds) {
    seconds = std::min(std::max(seconds, 0.0), kMaxIntervalSeconds);
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

} // namespace

SourceMode string_to_source_mode(const std::string& s) {
    if (s == "auto") return SourceMode::Auto;
    if (s == "notify" || s == "inotify") return SourceMode::Notify;
    if (s == "poll") return SourceMode::Poll;
    throw std::invalid_argument("Unknown source mode: " + s);
}

std::chrono::milliseconds EngineConfig::poll_interval_ms() const {
    return seconds_to_ms(poll_interval);
}

std::chrono::milliseconds EngineConfig::heartbeat_interval_ms() const {
    return seconds_to_ms(heartbeat_interval);
}

void EngineConfig::validate() const {
    if (poll_interval < 0.0 || poll_interval > kMaxIntervalSeconds) {
        throw std::invalid_argument("poll_interval must be between 0 and " +
                                    std::to_string(static_cast<int>(kMaxIntervalSeconds)) + " seconds");
    }
    if (backfill_lines < -1) {
        throw std::invalid_argument("backfill_lines must be -1 (all) or >= 0");
    }
    if (heartbeat_interval <= 0.0 || heartbeat_interval > kMaxIntervalSeconds) {
        throw std::invalid_argument("heartbeat_interval must be > 0 and at most " +
                                    std::to_string(static_cast<int>(kMaxIntervalSeconds)) + " seconds");
    }
    if (missing_retries < 0) {
        throw std::invalid_argument("missing_retries must be >= 0");
    }
    if (read_block_size == 0) {
        throw std::invalid_argument("read_block_size must be > 0");
    }
    if (max_line_bytes == 0) {
        throw std::invalid_argument("max_line_bytes must be > 0");
    }
}

nlohmann::json EngineConfig::to_json() const {
    return {
        {"poll_interval", poll_interval},
        {"backfill_lines", backfill_lines},
        {"heartbeat_enabled", heartbeat_enabled},
        {"heartbeat_interval", heartbeat_interval},
        {"mode", source_mode_to_string(mode)},
        {"missing_retries", missing_retries},
        {"read_block_size", read_block_size},
        {"max_line_bytes", max_line_bytes}
    };
}

EngineConfig EngineConfig::from_json(const nlohmann::json& j) {
    EngineConfig config;
    config.poll_interval = j.value("poll_interval", config.poll_interval);
    config.backfill_lines = j.value("backfill_lines", config.backfill_lines);
    config.heartbeat_enabled = j.value("heartbeat_enabled", config.heartbeat_enabled);
    config.heartbeat_interval = j.value("heartbeat_interval", config.heartbeat_interval);
    if (j.contains("mode")) config.mode = string_to_source_mode(j["mode"].get<std::string>());
    config.missing_retries = j.value("missing_retries", config.missing_retries);
    config.read_block_size = j.value("read_block_size", config.read_block_size);
    config.max_line_bytes = j.value("max_line_bytes", config.max_line_bytes);
    config.validate();
    return config;
}

EngineConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open config: " + path);
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse config " + path + ": " + e.what());
    }

    try {
        return EngineConfig::from_json(j);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid config " + path + ": " + e.what());
    }
}

} // namespace watchlogs
