#include "tail_source.hpp"
#include "tail_log.hpp"

#include <sys/inotify.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <limits>
#include <system_error>
#include <thread>

namespace watchlogs {

namespace {

constexpr uint32_t kWatchMask = IN_MODIFY | IN_ATTRIB | IN_MOVE_SELF | IN_DELETE_SELF;

bool is_missing(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

} // namespace

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
    if (this != &other) {
        reset(other.release());
    }
    return *this;
}

int FileHandle::release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
}

void FileHandle::reset(int fd) {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

TailSource::TailSource(std::string path, std::size_t block_size)
    : path_(std::move(path))
    , block_size_(std::max<std::size_t>(block_size, 1))
    , block_(block_size_, '\0')
{
}

TailSource::~TailSource() = default;

FileStat TailSource::attach(const ChunkHandler& backfill) {
    int fd = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "open " + path_);
    }
    handle_.reset(fd);

    std::error_code ec;
    auto st = stat_fd(fd, ec);
    if (!st) {
        throw std::system_error(ec, "fstat " + path_);
    }

    if (backfill) {
        read_range(fd, 0, st->size, [&backfill](std::string_view bytes, std::uint64_t) {
            return backfill(bytes);
        });
    }

    // Follow from the end seen at attach time; anything written since is read next cycle
    state_.attach(st->identity, st->size);
    return *st;
}

bool TailSource::open_handle() {
    int fd = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) {
            return false;
        }
        throw std::system_error(errno, std::generic_category(), "open " + path_);
    }
    handle_.reset(fd);

    std::error_code ec;
    auto st = stat_fd(fd, ec);
    if (!st) {
        throw std::system_error(ec, "fstat " + path_);
    }
    state_.attach(st->identity, 0);
    return true;
}

std::uint64_t TailSource::read_range(int fd, std::uint64_t from, std::uint64_t to,
                                     const std::function<bool(std::string_view, std::uint64_t)>& sink) {
    std::uint64_t pos = from;
    while (pos < to) {
        auto want = static_cast<std::size_t>(std::min<std::uint64_t>(block_size_, to - pos));
        ssize_t n = ::pread(fd, &block_[0], want, static_cast<off_t>(pos));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "read " + path_);
        }
        if (n == 0) {
            // Shrank underneath us, the next refresh reports it
            break;
        }

        std::string_view bytes(block_.data(), static_cast<std::size_t>(n));
        bool keep_going = sink(bytes, pos);
        pos += static_cast<std::uint64_t>(n);
        if (!keep_going) break;
    }
    return pos - from;
}

void TailSource::read(const EventHandler& handler) {
    std::error_code ec;
    auto st = stat_path(path_, ec);
    if (!st) {
        if (is_missing(ec)) {
            SourceEvent missing;
            missing.kind = SourceEvent::Kind::Missing;
            missing.offset = state_.offset();
            handler(missing);
            return;
        }
        throw std::system_error(ec, "stat " + path_);
    }

    std::uint64_t previous_offset = state_.offset();
    std::uint64_t end = st->size;

    auto status = state_.refresh(st->identity, st->size);
    if (status != RotationStatus::None) {
        TailLog::debug("TailSource", path_ + " " + rotation_status_to_string(status) + " at offset " +
                       std::to_string(previous_offset) + ", size now " + std::to_string(st->size));
    }

    switch (status) {
        case RotationStatus::Rotated: {
            // Drain what was appended to the old file before it was replaced
            if (handle_.valid()) {
                auto old = stat_fd(handle_.get(), ec);
                if (old && old->size > previous_offset) {
                    read_range(handle_.get(), previous_offset, old->size,
                        [&handler](std::string_view bytes, std::uint64_t pos) {
                            SourceEvent data;
                            data.bytes = bytes;
                            data.offset = pos;
                            handler(data);
                            return true;
                        });
                }
            }

            if (!open_handle()) {
                SourceEvent missing;
                missing.kind = SourceEvent::Kind::Missing;
                handler(missing);
                return;
            }
            on_reopen();

            SourceEvent rotated;
            rotated.kind = SourceEvent::Kind::Rotated;
            rotated.offset = 0;
            handler(rotated);

            auto fresh = stat_fd(handle_.get(), ec);
            if (!fresh) {
                throw std::system_error(ec, "fstat " + path_);
            }
            end = fresh->size;
            break;
        }
        case RotationStatus::Truncated: {
            SourceEvent truncated;
            truncated.kind = SourceEvent::Kind::Truncated;
            truncated.offset = state_.offset();
            handler(truncated);
            break;
        }
        case RotationStatus::None:
            break;
    }

    if (!handle_.valid() && !open_handle()) {
        SourceEvent missing;
        missing.kind = SourceEvent::Kind::Missing;
        handler(missing);
        return;
    }

    read_range(handle_.get(), state_.offset(), end,
        [this, &handler](std::string_view bytes, std::uint64_t pos) {
            state_.advance(bytes.size());
            SourceEvent data;
            data.bytes = bytes;
            data.offset = pos;
            handler(data);
            return true;
        });
}

NotifySource::NotifySource(std::string path, std::size_t block_size)
    : TailSource(std::move(path), block_size)
{
    int fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "inotify_init1");
    }
    inotify_.reset(fd);

    if (!add_watch()) {
        TailLog::debug("TailSource", "No watch yet for " + this->path() + ", will retry");
    }
}

NotifySource::~NotifySource() {
    remove_watch();
}

bool NotifySource::add_watch() {
    int wd = ::inotify_add_watch(inotify_.get(), path().c_str(), kWatchMask);
    if (wd < 0) {
        watch_desc_ = -1;
        return false;
    }
    watch_desc_ = wd;
    return true;
}

void NotifySource::remove_watch() {
    if (watch_desc_ < 0) return;
    // EINVAL means the kernel already dropped the watch (file deleted)
    if (::inotify_rm_watch(inotify_.get(), watch_desc_) != 0 && errno != EINVAL) {
        TailLog::debug("TailSource", "inotify_rm_watch failed for " + path());
    }
    watch_desc_ = -1;
}

void NotifySource::on_reopen() {
    remove_watch();
    if (!add_watch()) {
        TailLog::debug("TailSource", "Could not re-arm watch for " + path());
    }
}

bool NotifySource::wait(std::chrono::milliseconds timeout) {
    if (watch_desc_ < 0 && !add_watch()) {
        // Nothing to be notified about until the path exists again
        std::this_thread::sleep_for(timeout);
        return false;
    }

    pollfd pfd{};
    pfd.fd = inotify_.get();
    pfd.events = POLLIN;

    // poll(2) takes an int, a negative value would block forever
    auto timeout_ms = std::min<std::chrono::milliseconds::rep>(
        std::max<std::chrono::milliseconds::rep>(timeout.count(), 0), std::numeric_limits<int>::max());
    int rc = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
    if (rc < 0) {
        if (errno == EINTR) return false;
        throw std::system_error(errno, std::generic_category(), "poll inotify");
    }
    if (rc == 0) {
        return false;
    }
    return drain_events();
}

bool NotifySource::drain_events() {
    alignas(struct inotify_event) char buffer[4096];
    bool woke = false;

    for (;;) {
        ssize_t n = ::read(inotify_.get(), buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            throw std::system_error(errno, std::generic_category(), "read inotify");
        }
        if (n == 0) break;

        for (char* p = buffer; p < buffer + n;) {
            const auto* event = reinterpret_cast<const struct inotify_event*>(p);
            if (event->wd == watch_desc_ && (event->mask & IN_IGNORED)) {
                watch_desc_ = -1;
            }
            woke = true;
            p += sizeof(struct inotify_event) + event->len;
        }
    }
    return woke;
}

PollSource::PollSource(std::string path, std::size_t block_size)
    : TailSource(std::move(path), block_size)
{
}

bool PollSource::wait(std::chrono::milliseconds timeout) {
    if (timeout.count() > 0) {
        std::this_thread::sleep_for(timeout);
    } else {
        std::this_thread::yield();
    }
    return false;
}

std::unique_ptr<TailSource> make_source(const std::string& path, const EngineConfig& config) {
    // Set the first time inotify_init1 fails so later watchers go straight to polling
    static std::atomic<bool> notify_unavailable{false};

    switch (config.mode) {
        case SourceMode::Poll:
            return std::make_unique<PollSource>(path, config.read_block_size);
        case SourceMode::Notify:
            return std::make_unique<NotifySource>(path, config.read_block_size);
        case SourceMode::Auto:
        default:
            break;
    }

    if (!notify_unavailable) {
        try {
            return std::make_unique<NotifySource>(path, config.read_block_size);
        } catch (const std::system_error& e) {
            notify_unavailable = true;
            TailLog::log("TailSource", std::string("inotify unavailable, falling back to polling: ") + e.what());
        }
    }
    return std::make_unique<PollSource>(path, config.read_block_size);
}

} // namespace watchlogs
