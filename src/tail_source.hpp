#pragma once

#include "engine_config.hpp"
#include "file_state.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace watchlogs {

// Owns a file descriptor, closes it on destruction
class FileHandle {
public:
    FileHandle() = default;
    explicit FileHandle(int fd) : fd_(fd) {}
    ~FileHandle() { reset(); }

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;
    FileHandle(FileHandle&& other) noexcept : fd_(other.release()) {}
    FileHandle& operator=(FileHandle&& other) noexcept;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    int release();
    void reset(int fd = -1);

private:
    int fd_ = -1;
};

struct SourceEvent {
    enum class Kind {
        Data,       // bytes holds newly appended content
        Rotated,    // Path was replaced, reading restarts at 0 of the new file
        Truncated,  // File shrank, reading resumes at the new size
        Missing     // Path cannot be found
    };

    Kind kind = Kind::Data;
    std::string_view bytes;
    std::uint64_t offset = 0;     // Offset of bytes, or the new offset for control events
};

// Change detection + incremental reads for one path.
//
// Subclasses only decide how to wait for a change. read() always goes to the
// end of file as it was when stat'ed, so a missed or coalesced wake-up only
// costs latency, never data.
class TailSource {
public:
    using EventHandler = std::function<void(const SourceEvent&)>;
    using ChunkHandler = std::function<bool(std::string_view)>;

    TailSource(std::string path, std::size_t block_size);
    virtual ~TailSource();

    TailSource(const TailSource&) = delete;
    TailSource& operator=(const TailSource&) = delete;

    // Open the path and start following it from its current end. When backfill
    // is set, the existing content is passed to it first, block by block; the
    // handler returns false to stop early. Throws std::system_error when the
    // file cannot be opened.
    FileStat attach(const ChunkHandler& backfill = nullptr);

    // Block until a change may have happened or timeout elapses.
    // Returns true when woken by a change notification.
    virtual bool wait(std::chrono::milliseconds timeout) = 0;

    // Report rotation/truncation and deliver appended bytes. The handler
    // returns normally to continue; a Missing event ends the read.
    // Throws std::system_error for I/O errors other than a missing file.
    void read(const EventHandler& handler);

    virtual SourceMode mode() const = 0;

    const std::string& path() const { return path_; }
    const FileState& state() const { return state_; }

protected:
    // Called after the handle was re-opened on a new file
    virtual void on_reopen() {}

private:
    bool open_handle();
    std::uint64_t read_range(int fd, std::uint64_t from, std::uint64_t to,
                             const std::function<bool(std::string_view, std::uint64_t)>& sink);

    std::string path_;
    std::size_t block_size_;
    FileState state_;
    FileHandle handle_;
    std::string block_;
};

// inotify on the file itself (IN_MODIFY | IN_ATTRIB | IN_MOVE_SELF | IN_DELETE_SELF)
class NotifySource : public TailSource {
public:
    // Throws std::system_error when inotify is unavailable
    NotifySource(std::string path, std::size_t block_size);
    ~NotifySource() override;

    bool wait(std::chrono::milliseconds timeout) override;
    SourceMode mode() const override { return SourceMode::Notify; }

protected:
    void on_reopen() override;

private:
    bool add_watch();
    void remove_watch();
    bool drain_events();

    FileHandle inotify_;
    int watch_desc_ = -1;
};

// Sleeps for the interval, every read stats the file
class PollSource : public TailSource {
public:
    PollSource(std::string path, std::size_t block_size);

    bool wait(std::chrono::milliseconds timeout) override;
    SourceMode mode() const override { return SourceMode::Poll; }
};

// Pick the source for a mode. Auto falls back to polling when inotify cannot be
// initialised; Notify rethrows that failure.
std::unique_ptr<TailSource> make_source(const std::string& path, const EngineConfig& config);

} // namespace watchlogs
