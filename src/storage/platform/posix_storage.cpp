#include <spdlog/spdlog.h>
#include <canopy/storage/platform.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace canopy::storage::platform {

namespace {

Error errnoError(int err, const std::string& what) {
    switch (err) {
        case EACCES:
        case EPERM:
        case EROFS:
            return Error{ErrorCode::PermissionDenied, what + ": " + std::strerror(err)};
        case ENOSPC:
        case EDQUOT:
            return Error{ErrorCode::StorageFull, what + ": " + std::strerror(err)};
        case ENOENT:
            return Error{ErrorCode::FileNotFound, what + ": " + std::strerror(err)};
        default:
            return Error{ErrorCode::WriteError, what + ": " + std::strerror(err)};
    }
}

} // namespace

Result<void> atomicRename(const std::filesystem::path& from, const std::filesystem::path& to) {
    if (::rename(from.c_str(), to.c_str()) == 0) {
        return {};
    }

    int err = errno;
    spdlog::error("Rename {} -> {} failed: {} (errno: {})", from.string(), to.string(),
                  std::strerror(err), err);
    return errnoError(err, "rename " + to.string());
}

Result<void> writeFileFully(const std::filesystem::path& path, std::string_view data, bool sync) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                    S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
    if (fd < 0) {
        int err = errno;
        spdlog::error("Failed to create temp file {}: {}", path.string(), std::strerror(err));
        return errnoError(err, "open " + path.string());
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t result = ::write(fd, data.data() + written, data.size() - written);
        if (result < 0) {
            if (errno == EINTR)
                continue;
            int err = errno;
            ::close(fd);
            return errnoError(err, "write " + path.string());
        }
        written += static_cast<size_t>(result);
    }

    // Ensure data is on disk before the rename makes it visible
    if (sync && ::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        return errnoError(err, "fsync " + path.string());
    }

    if (::close(fd) != 0) {
        return errnoError(errno, "close " + path.string());
    }
    return {};
}

Result<void> syncDirectory(const std::filesystem::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        spdlog::error("Failed to open directory for sync: {}", dir.string());
        return errnoError(err, "open " + dir.string());
    }

    // Sync directory metadata
    int result = ::fsync(fd);
    int err = errno;
    ::close(fd);

    if (result != 0) {
        spdlog::error("Failed to sync directory: {} (errno: {})", dir.string(), err);
        return errnoError(err, "fsync " + dir.string());
    }

    return {};
}

} // namespace canopy::storage::platform
