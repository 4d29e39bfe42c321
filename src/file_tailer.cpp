#include "file_tailer.hpp"
#include "tail_log.hpp"
#include <ctime>
#include <deque>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace watchlogs {

namespace {

// inotify wake-up slice when throttling is disabled, bounds how long a halt goes unnoticed
constexpr std::chrono::milliseconds kNotifyWakeSlice{250};

std::string format_mtime(double mtime) {
    std::time_t t = static_cast<std::time_t>(mtime);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%a %b %e %H:%M:%S %Y");
    return ss.str();
}

} // namespace

FileTailer::FileTailer(OutputChannel& channel, const std::string& path, const EngineConfig& config)
    : channel_(channel)
    , path_(path)
    , config_(config)
    , buffer_(config.max_line_bytes)
    , heartbeat_(path, config.heartbeat_interval_ms())
    , mode_(config.mode)
{
}

FileTailer::~FileTailer() {
    stop();
    join();
}

void FileTailer::start() {
    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (running_ || thread_.joinable()) return;

    running_ = true;
    thread_ = std::thread([this]() {
        run();
    });
}

void FileTailer::stop() {
    stop_requested_ = true;
}

void FileTailer::join() {
    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool FileTailer::has_thread() {
    std::lock_guard<std::mutex> lock(thread_mutex_);
    return thread_.joinable();
}

void FileTailer::run() {
    running_ = true;
    try {
        if (attach()) {
            set_state(WatchState::Streaming);
            while (follow_once()) {
            }
        }
    } catch (const std::exception& e) {
        TailLog::error("FileTailer", "Watcher for " + path_ + " failed: " + e.what());
        exit_reason_ = WatchState::Terminated;
    }

    set_state(WatchState::Terminated);
    running_ = false;
    TailLog::log("FileTailer", "Stopped tailing: " + path_ + " (" +
                 watch_state_to_string(exit_reason_) + ")");
}

bool FileTailer::check_halt() {
    if (!halted_ && (stop_requested_ || (config_.halting && config_.halting()))) {
        halted_ = true;
    }
    if (halted_) {
        set_state(WatchState::Cancelled);
        exit_reason_ = WatchState::Cancelled;
    }
    return halted_;
}

bool FileTailer::attach() {
    set_state(WatchState::Attaching);
    if (check_halt()) return false;

    std::error_code ec;
    auto existing = stat_path(path_, ec);
    if (!existing) {
        // A watch needs an inode, so start from an empty file
        std::ofstream touch(path_, std::ios::app);
        if (!touch) {
            TailLog::error("FileTailer", "File not found and could not be created: " + path_);
            end_missing("file not found, skipping");
            return false;
        }
        TailLog::log("FileTailer", "Created empty file to watch: " + path_);
    }

    source_ = make_source(path_, config_);
    mode_ = source_->mode();

    const bool backfill_all = config_.backfill_lines < 0;
    const auto backfill_limit = static_cast<std::size_t>(backfill_all ? 0 : config_.backfill_lines);
    std::optional<std::string> stale_note;
    if (existing) {
        stale_note = format_mtime(existing->mtime);
    }

    // Existing content always passes through the buffer so an unterminated
    // last line is completed by the first append, even with backfill off
    std::deque<DecodedLine> recent;
    auto backfill = [&](std::string_view bytes) {
        auto result = buffer_.feed(bytes);
        if (config_.backfill_lines == 0) return true;
        for (auto& line : result.lines) {
            if (backfill_all) {
                if (!emit_line(EventKind::Backfill, std::move(line), stale_note)) return false;
            } else {
                recent.push_back(std::move(line));
                if (recent.size() > backfill_limit) recent.pop_front();
            }
        }
        return true;
    };

    FileStat st;
    try {
        st = source_->attach(backfill);
    } catch (const std::system_error& e) {
        // Removed between the stat above and the open
        if (e.code() != std::errc::no_such_file_or_directory) throw;
        TailLog::error("FileTailer", std::string("File vanished during attach: ") + e.what());
        end_missing("file not found, skipping");
        return false;
    }
    for (auto& line : recent) {
        if (!emit_line(EventKind::Backfill, std::move(line), stale_note)) break;
    }

    offset_ = source_->state().offset();
    heartbeat_ = HeartbeatMonitor(path_, config_.heartbeat_interval_ms());
    last_read_ = std::chrono::steady_clock::now();

    TailLog::log("FileTailer", "Started tailing: " + path_ + " (" +
                 source_mode_to_string(mode_) + ", " + std::to_string(st.size) + " bytes, inode " +
                 st.identity.to_string() + ")");
    return !check_halt();
}

bool FileTailer::follow_once() {
    if (check_halt()) return false;

    const auto interval = config_.poll_interval_ms();
    const bool notify = source_->mode() == SourceMode::Notify;
    auto timeout = interval;
    if (notify && interval.count() == 0) {
        timeout = kNotifyWakeSlice;
    }

    try {
        source_->wait(timeout);
    } catch (const std::system_error& e) {
        TailLog::error("FileTailer", std::string("Wait failed for ") + path_ + ": " + e.what());
        std::this_thread::sleep_for(kNotifyWakeSlice);
    }

    if (check_halt()) return false;

    // Coalesce notification bursts into one read per interval
    if (notify && interval.count() > 0) {
        auto earliest = last_read_ + interval;
        if (std::chrono::steady_clock::now() < earliest) {
            std::this_thread::sleep_until(earliest);
            if (check_halt()) return false;
        }
    }
    last_read_ = std::chrono::steady_clock::now();

    bool missing = false;
    try {
        source_->read([this, &missing](const SourceEvent& event) {
            handle(event, missing);
        });
    } catch (const std::system_error& e) {
        TailLog::error("FileTailer", std::string("Error reading file: ") + e.what());
        set_state(WatchState::Streaming);
        return true;
    }
    offset_ = source_->state().offset();

    if (missing) {
        if (missing_checks_ < config_.missing_retries) {
            ++missing_checks_;
            TailLog::debug("FileTailer", "File missing, check " + std::to_string(missing_checks_) +
                           " of " + std::to_string(config_.missing_retries) + ": " + path_);
            return true;
        }
        TailLog::log("FileTailer", "File no longer exists, exiting watcher: " + path_);
        flush_remainder();
        end_missing("file no longer exists, stopped watching");
        return false;
    }
    missing_checks_ = 0;

    if (config_.heartbeat_enabled) {
        if (auto report = heartbeat_.tick()) {
            channel_.deliver(*report);
        }
    }
    return true;
}

void FileTailer::handle(const SourceEvent& event, bool& missing) {
    switch (event.kind) {
        case SourceEvent::Kind::Data: {
            auto result = buffer_.feed(event.bytes);
            for (auto& line : result.lines) {
                if (!emit_line(EventKind::Line, std::move(line))) break;
            }
            break;
        }
        case SourceEvent::Kind::Rotated:
            set_state(WatchState::Rotating);
            flush_remainder();
            TailLog::log("FileTailer", "File rotated, following new file: " + path_);
            emit_notice(EventKind::Rotated, "file rotated, following new file from the start");
            set_state(WatchState::Streaming);
            break;
        case SourceEvent::Kind::Truncated:
            set_state(WatchState::Truncating);
            buffer_.clear();
            TailLog::log("FileTailer", "File truncated, resetting position: " + path_);
            emit_notice(EventKind::Truncated,
                        "file truncated, resuming at byte " + std::to_string(event.offset));
            set_state(WatchState::Streaming);
            break;
        case SourceEvent::Kind::Missing:
            missing = true;
            break;
    }
}

bool FileTailer::emit_line(EventKind kind, DecodedLine line, std::optional<std::string> note) {
    if (halted_ || stop_requested_) return false;

    LineEvent event;
    event.path = path_;
    event.text = std::move(line.text);
    event.kind = kind;
    event.note = std::move(note);
    event.decoding = line.decoding;
    event.timestamp = wall_clock_now();

    if (kind == EventKind::Line) {
        heartbeat_.record(event.text);
    }
    channel_.deliver(event);
    return true;
}

void FileTailer::flush_remainder() {
    if (auto line = buffer_.flush()) {
        emit_line(EventKind::Line, std::move(*line));
    }
}

void FileTailer::end_missing(const std::string& note) {
    set_state(WatchState::Missing);
    exit_reason_ = WatchState::Missing;
    emit_notice(EventKind::Missing, note);
}

void FileTailer::emit_notice(EventKind kind, const std::string& note) {
    if (halted_ || stop_requested_) return;

    LineEvent event;
    event.path = path_;
    event.kind = kind;
    event.note = note;
    event.timestamp = wall_clock_now();
    channel_.deliver(event);
}

} // namespace watchlogs
