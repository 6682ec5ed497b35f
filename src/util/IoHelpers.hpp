/**
 * @file IoHelpers.hpp
 * @brief Positioned I/O loops over raw file descriptors
 */

#pragma once

#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>

namespace util {

/**
 * @brief pwrite() the whole buffer, retrying on EINTR/EAGAIN and short writes
 * @return Bytes written (== size on success), or -1 with errno set
 */
inline auto pwrite_all(int fd, const void* buffer, size_t size, uint64_t offset) -> ssize_t {
    const auto* bytes = static_cast<const unsigned char*>(buffer);
    size_t done = 0;
    while (done < size) {
        const auto result = ::pwrite(fd, bytes + done, size - done,
                                     static_cast<off_t>(offset + done));
        if (result < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            return -1;
        }
        if (result == 0) {
            errno = EIO;
            return -1;
        }
        done += static_cast<size_t>(result);
    }
    return static_cast<ssize_t>(done);
}

/**
 * @brief pread() the whole range, retrying on EINTR/EAGAIN and short reads
 * @return Bytes read; less than size only at end of file, -1 with errno on error
 */
inline auto pread_all(int fd, void* buffer, size_t size, uint64_t offset) -> ssize_t {
    auto* bytes = static_cast<unsigned char*>(buffer);
    size_t done = 0;
    while (done < size) {
        const auto result = ::pread(fd, bytes + done, size - done,
                                    static_cast<off_t>(offset + done));
        if (result < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            return -1;
        }
        if (result == 0) {
            break;
        }
        done += static_cast<size_t>(result);
    }
    return static_cast<ssize_t>(done);
}

/**
 * @brief Whether an errno from a read/write is worth retrying
 */
[[nodiscard]] inline auto is_transient_errno(int err) -> bool {
    switch (err) {
        case EIO:
        case EINTR:
        case EAGAIN:
        case ETIMEDOUT:
        case EBUSY:
            return true;
        default:
            return false;
    }
}

} // namespace util
