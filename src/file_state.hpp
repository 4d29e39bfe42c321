#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

namespace watchlogs {

// Device + inode pair; a change means the path now names a different file
struct FileIdentity {
    std::uint64_t device = 0;
    std::uint64_t inode = 0;

    bool operator==(const FileIdentity& other) const {
        return device == other.device && inode == other.inode;
    }
    bool operator!=(const FileIdentity& other) const { return !(*this == other); }

    std::string to_string() const {
        return std::to_string(device) + ":" + std::to_string(inode);
    }
};

struct FileStat {
    FileIdentity identity;
    std::uint64_t size = 0;
    double mtime = 0.0;             // Unix time of last modification
};

// stat(2) the path. Returns nullopt and sets ec when it cannot be stat'ed
// (ENOENT for a missing file).
std::optional<FileStat> stat_path(const std::string& path, std::error_code& ec);

// fstat(2) an open descriptor
std::optional<FileStat> stat_fd(int fd, std::error_code& ec);

enum class RotationStatus {
    None,
    Rotated,
    Truncated
};

inline const char* rotation_status_to_string(RotationStatus s) {
    switch (s) {
        case RotationStatus::None: return "none";
        case RotationStatus::Rotated: return "rotated";
        case RotationStatus::Truncated: return "truncated";
        default: return "unknown";
    }
}

// Identity and read offset of one watched file.
// The offset only moves forward, except on rotation (back to 0) and
// truncation (down to the new size).
class FileState {
public:
    void attach(const FileIdentity& identity, std::uint64_t offset);

    RotationStatus refresh(const FileIdentity& current, std::uint64_t size);

    void advance(std::uint64_t bytes) { offset_ += bytes; }

    bool attached() const { return attached_; }
    std::uint64_t offset() const { return offset_; }
    const FileIdentity& identity() const { return identity_; }

private:
    FileIdentity identity_;
    std::uint64_t offset_ = 0;
    bool attached_ = false;
};

} // namespace watchlogs
