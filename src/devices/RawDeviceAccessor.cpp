/**
 * @file RawDeviceAccessor.cpp
 * @brief pread/pwrite access path
 */

#include "devices/RawDeviceAccessor.hpp"

#include "util/IoHelpers.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <linux/fs.h>

namespace devices {

namespace {
constexpr size_t ZERO_FILL_CHUNK = 1'024 * 1'024;

auto is_access_errno(int err) -> bool {
    return err == EACCES || err == EPERM || err == EBUSY || err == EWOULDBLOCK ||
           err == EROFS;
}
}  // namespace

RawDeviceAccessor::RawDeviceAccessor(DeviceInfo device)
    : device_(std::move(device)), capacity_(device_.capacity_bytes) {}

RawDeviceAccessor::~RawDeviceAccessor() {
    close();
}

auto RawDeviceAccessor::map_open_error(int err, const std::string& what) const -> util::Error {
    auto message = what + " " + device_.path + ": " + std::strerror(err);
    if (is_access_errno(err)) {
        return util::Error::access_denied(std::move(message), err);
    }
    return util::Error::device_io(std::move(message), err, false);
}

auto RawDeviceAccessor::query_size(int fd) const -> std::expected<uint64_t, util::Error> {
    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        return std::unexpected(map_open_error(errno, "Failed to stat"));
    }

    if (S_ISBLK(st.st_mode)) {
        uint64_t size = 0;
        if (::ioctl(fd, BLKGETSIZE64, &size) != 0) {
            return std::unexpected(map_open_error(errno, "Failed to query size of"));
        }
        return size;
    }
    return static_cast<uint64_t>(st.st_size);
}

auto RawDeviceAccessor::detect_capability() -> std::expected<AccessCapabilities, util::Error> {
    struct stat st{};
    if (::stat(device_.path.c_str(), &st) != 0) {
        return std::unexpected(map_open_error(errno, "Cannot access"));
    }
    if (!S_ISBLK(st.st_mode) && !S_ISREG(st.st_mode)) {
        return std::unexpected(util::Error::unsupported(
            device_.path + " is neither a block device nor an image file"));
    }
    if (::access(device_.path.c_str(), R_OK | W_OK) != 0) {
        return std::unexpected(map_open_error(errno, "No read/write permission on"));
    }

    AccessCapabilities caps;
    caps.mode = AccessMode::DIRECT;
    caps.addressable = true;
    caps.can_verify = true;
    caps.capacity_bytes = device_.capacity_bytes;
    caps.description = S_ISBLK(st.st_mode) ? "raw block device" : "image file";
    return caps;
}

auto RawDeviceAccessor::open() -> std::expected<void, util::Error> {
    if (fd_.is_valid()) {
        return {};
    }

    struct stat st{};
    if (::stat(device_.path.c_str(), &st) != 0) {
        return std::unexpected(map_open_error(errno, "Cannot access"));
    }

    // O_EXCL without O_CREAT only has meaning for block devices
    int flags = O_RDWR | O_CLOEXEC;
    if (S_ISBLK(st.st_mode)) {
        flags |= O_EXCL;
    }

    util::FileDescriptor fd{::open(device_.path.c_str(), flags)};
    if (!fd) {
        return std::unexpected(map_open_error(errno, "Failed to open"));
    }

    if (int err = fd.try_lock_exclusive(); err != 0) {
        return std::unexpected(map_open_error(err, "Failed to lock"));
    }

    auto size = query_size(fd.get());
    if (!size) {
        return std::unexpected(size.error());
    }
    if (*size == 0) {
        return std::unexpected(util::Error::device_io(device_.path + " reports zero size", 0,
                                                      false));
    }

    capacity_ = device_.capacity_bytes > 0 ? std::min(*size, device_.capacity_bytes) : *size;
    if (*size < device_.capacity_bytes) {
        LOG_WARNING("RawDeviceAccessor", device_.path + " is smaller than its inventory size (" +
                                             std::to_string(*size) + " < " +
                                             std::to_string(device_.capacity_bytes) + ")");
    }

    fd_ = std::move(fd);
    LOG_DEBUG("RawDeviceAccessor",
              "Opened " + device_.path + " capacity=" + std::to_string(capacity_));
    return {};
}

auto RawDeviceAccessor::write_chunk(uint64_t offset, std::span<const uint8_t> data)
    -> std::expected<void, util::Error> {
    if (!fd_) {
        return std::unexpected(util::Error::device_io("Device is not open", EBADF, false));
    }
    if (auto range = check_range(offset, data.size(), capacity_); !range) {
        return range;
    }

    if (util::pwrite_all(fd_.get(), data.data(), data.size(), offset) < 0) {
        const int err = errno;
        auto error = util::Error::device_io(
            "Write failed at offset " + std::to_string(offset) + ": " + std::strerror(err), err,
            util::is_transient_errno(err));
        error.offset = offset;
        return std::unexpected(std::move(error));
    }
    return {};
}

auto RawDeviceAccessor::read_chunk(uint64_t offset, std::span<uint8_t> out)
    -> std::expected<void, util::Error> {
    if (!fd_) {
        return std::unexpected(util::Error::device_io("Device is not open", EBADF, false));
    }
    if (auto range = check_range(offset, out.size(), capacity_); !range) {
        return range;
    }

    const auto result = util::pread_all(fd_.get(), out.data(), out.size(), offset);
    if (result < 0 || static_cast<size_t>(result) != out.size()) {
        const int err = result < 0 ? errno : EIO;
        auto error = util::Error::device_io(
            "Read failed at offset " + std::to_string(offset) + ": " + std::strerror(err), err,
            util::is_transient_errno(err));
        error.offset = offset;
        return std::unexpected(std::move(error));
    }
    return {};
}

auto RawDeviceAccessor::zero_fill_device(const std::atomic<bool>& cancel_flag)
    -> std::expected<void, util::Error> {
    if (!fd_) {
        return std::unexpected(util::Error::device_io("Device is not open", EBADF, false));
    }

    struct stat st{};
    if (::fstat(fd_.get(), &st) == 0 && S_ISBLK(st.st_mode)) {
        uint64_t range[2] = {0, capacity_};
        if (::ioctl(fd_.get(), BLKZEROOUT, range) == 0) {
            return flush();
        }
        LOG_DEBUG("RawDeviceAccessor",
                  std::string("BLKZEROOUT unavailable, writing zeros: ") + std::strerror(errno));
    }

    std::vector<uint8_t> zeros(ZERO_FILL_CHUNK, 0x00);
    uint64_t offset = 0;
    while (offset < capacity_) {
        if (cancel_flag.load()) {
            return std::unexpected(util::Error::cancelled());
        }
        auto length = static_cast<size_t>(std::min<uint64_t>(zeros.size(), capacity_ - offset));
        if (auto written = write_chunk(offset, std::span<const uint8_t>(zeros.data(), length));
            !written) {
            return written;
        }
        offset += length;
    }
    return flush();
}

auto RawDeviceAccessor::flush() -> std::expected<void, util::Error> {
    if (!fd_) {
        return {};
    }
    if (::fsync(fd_.get()) != 0) {
        const int err = errno;
        return std::unexpected(util::Error::device_io(
            std::string("fsync failed: ") + std::strerror(err), err, util::is_transient_errno(err)));
    }
    return {};
}

void RawDeviceAccessor::close() {
    if (!fd_) {
        return;
    }
    if (::fsync(fd_.get()) != 0) {
        LOG_WARNING("RawDeviceAccessor",
                    std::string("fsync on close failed: ") + std::strerror(errno));
    }
    if (int err = fd_.reset(); err != 0) {
        LOG_WARNING("RawDeviceAccessor",
                    "Closing " + device_.path + " failed: " + std::strerror(err));
    }
}

}  // namespace devices
