/**
 * @file FileDescriptor.hpp
 * @brief RAII wrapper for POSIX file descriptors with advisory locking
 *
 * Owns a descriptor and the exclusive flock() taken on it. Closing the
 * descriptor releases the lock.
 */

#pragma once

#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <utility>

namespace util {

/**
 * @class FileDescriptor
 * @brief Move-only owner of a POSIX file descriptor
 */
class FileDescriptor {
public:
    FileDescriptor() noexcept = default;

    /**
     * @brief Take ownership of a raw file descriptor (may be invalid)
     */
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}

    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept
        : fd_(std::exchange(other.fd_, -1)), locked_(std::exchange(other.locked_, false)) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = std::exchange(other.fd_, -1);
            locked_ = std::exchange(other.locked_, false);
        }
        return *this;
    }

    [[nodiscard]] constexpr auto get() const noexcept -> int { return fd_; }

    [[nodiscard]] constexpr auto is_valid() const noexcept -> bool { return fd_ >= 0; }

    [[nodiscard]] constexpr auto is_locked() const noexcept -> bool { return locked_; }

    explicit operator bool() const noexcept { return is_valid(); }

    /**
     * @brief Take a non-blocking exclusive advisory lock
     * @return 0 on success, otherwise the errno of the failed flock()
     *         (EWOULDBLOCK when another process holds the lock)
     */
    auto try_lock_exclusive() noexcept -> int {
        if (!is_valid()) {
            return EBADF;
        }
        while (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
            if (errno != EINTR) {
                return errno;
            }
        }
        locked_ = true;
        return 0;
    }

    /**
     * @brief Close the descriptor (and drop the lock) if one is held
     * @return 0, or the errno reported by close()
     */
    auto reset() noexcept -> int {
        int result = 0;
        if (is_valid()) {
            if (locked_) {
                ::flock(fd_, LOCK_UN);
            }
            if (::close(fd_) != 0) {
                result = errno;
            }
        }
        fd_ = -1;
        locked_ = false;
        return result;
    }

private:
    int fd_ = -1;
    bool locked_ = false;
};

}  // namespace util
