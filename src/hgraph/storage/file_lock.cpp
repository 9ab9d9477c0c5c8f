#include "hgraph/storage/file_lock.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include "hgraph/common/logger.h"

namespace hgraph {
namespace storage {

core::Result<FileLock> FileLock::Acquire(const std::string& path, Mode mode) {
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return core::Result<FileLock>::error(
            core::Error::Code::IO_ERROR,
            "Failed to open lock file " + path + ": " + std::strerror(errno));
    }

    int op = mode == Mode::EXCLUSIVE ? LOCK_EX : LOCK_SH;
    int rc;
    do {
        rc = ::flock(fd, op);
    } while (rc != 0 && errno == EINTR);

    if (rc != 0) {
        int saved = errno;
        ::close(fd);
        return core::Result<FileLock>::error(
            core::Error::Code::IO_ERROR,
            "Failed to lock " + path + ": " + std::strerror(saved));
    }

    HGRAPH_TRACE("Acquired {} lock on {}", mode == Mode::EXCLUSIVE ? "exclusive" : "shared", path);
    return core::Result<FileLock>(FileLock(fd, mode));
}

FileLock::~FileLock() {
    release();
}

FileLock::FileLock(FileLock&& other) noexcept : fd_(other.fd_), mode_(other.mode_) {
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        mode_ = other.mode_;
        other.fd_ = -1;
    }
    return *this;
}

void FileLock::release() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace storage
} // namespace hgraph
