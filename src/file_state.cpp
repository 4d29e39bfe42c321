#include "file_state.hpp"
#include <sys/stat.h>
#include <cerrno>

namespace watchlogs {

namespace {

FileStat from_stat(const struct stat& st) {
    FileStat result;
    result.identity.device = static_cast<std::uint64_t>(st.st_dev);
    result.identity.inode = static_cast<std::uint64_t>(st.st_ino);
    result.size = static_cast<std::uint64_t>(st.st_size);
    result.mtime = static_cast<double>(st.st_mtim.tv_sec) +
                   static_cast<double>(st.st_mtim.tv_nsec) / 1e9;
    return result;
}

} // namespace

std::optional<FileStat> stat_path(const std::string& path, std::error_code& ec) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        ec.assign(errno, std::generic_category());
        return std::nullopt;
    }
    ec.clear();
    return from_stat(st);
}

std::optional<FileStat> stat_fd(int fd, std::error_code& ec) {
    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        ec.assign(errno, std::generic_category());
        return std::nullopt;
    }
    ec.clear();
    return from_stat(st);
}

void FileState::attach(const FileIdentity& identity, std::uint64_t offset) {
    identity_ = identity;
    offset_ = offset;
    attached_ = true;
}

RotationStatus FileState::refresh(const FileIdentity& current, std::uint64_t size) {
    if (!attached_) {
        attach(current, 0);
        return RotationStatus::None;
    }

    if (current != identity_) {
        identity_ = current;
        offset_ = 0;
        attached_ = true;
        return RotationStatus::Rotated;
    }

    if (size < offset_) {
        offset_ = size;
        return RotationStatus::Truncated;
    }

    return RotationStatus::None;
}

} // namespace watchlogs
