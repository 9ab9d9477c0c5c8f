#ifndef HGRAPH_STORAGE_FILE_LOCK_H_
#define HGRAPH_STORAGE_FILE_LOCK_H_

#include <string>

#include "hgraph/core/result.h"

namespace hgraph {
namespace storage {

/**
 * @brief RAII advisory lock on a lock file (flock)
 *
 * Writers take the lock exclusively, readers take it shared. The lock is
 * released when the object is destroyed. Only cooperating hgraph processes
 * are serialized; the lock is advisory. Moving transfers ownership of the
 * lock; a default-constructed or moved-from object holds nothing.
 */
class FileLock {
public:
    enum class Mode {
        SHARED,
        EXCLUSIVE
    };

    /**
     * @brief Opens (creating if needed) the lock file and blocks until the lock is held
     * @return IO_ERROR if the file cannot be opened or locked
     */
    static core::Result<FileLock> Acquire(const std::string& path, Mode mode);

    FileLock() = default;
    ~FileLock();

    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool held() const { return fd_ >= 0; }
    Mode mode() const { return mode_; }

private:
    FileLock(int fd, Mode mode) : fd_(fd), mode_(mode) {}

    void release();

    int fd_ = -1;
    Mode mode_ = Mode::SHARED;
};

} // namespace storage
} // namespace hgraph

#endif // HGRAPH_STORAGE_FILE_LOCK_H_
