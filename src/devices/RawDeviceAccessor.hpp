/**
 * @file RawDeviceAccessor.hpp
 * @brief Direct block-level access through pread/pwrite
 */

#pragma once

#include "devices/IDeviceAccessor.hpp"
#include "util/FileDescriptor.hpp"

#include <string>

namespace devices {

/**
 * @class RawDeviceAccessor
 * @brief Addressable access to a block device or image file
 *
 * Opens the path O_RDWR | O_EXCL (exclusive for block devices) and takes a
 * non-blocking flock(). Capacity comes from BLKGETSIZE64 for block devices
 * and from the file size otherwise, clamped to the inventory capacity.
 */
class RawDeviceAccessor : public IDeviceAccessor {
public:
    explicit RawDeviceAccessor(DeviceInfo device);
    ~RawDeviceAccessor() override;

    RawDeviceAccessor(const RawDeviceAccessor&) = delete;
    RawDeviceAccessor& operator=(const RawDeviceAccessor&) = delete;

    [[nodiscard]] auto detect_capability()
        -> std::expected<AccessCapabilities, util::Error> override;
    [[nodiscard]] auto open() -> std::expected<void, util::Error> override;
    [[nodiscard]] auto write_chunk(uint64_t offset, std::span<const uint8_t> data)
        -> std::expected<void, util::Error> override;
    [[nodiscard]] auto read_chunk(uint64_t offset, std::span<uint8_t> out)
        -> std::expected<void, util::Error> override;
    [[nodiscard]] auto zero_fill_device(const std::atomic<bool>& cancel_flag)
        -> std::expected<void, util::Error> override;
    [[nodiscard]] auto flush() -> std::expected<void, util::Error> override;
    void close() override;

    [[nodiscard]] auto capacity() const -> uint64_t override { return capacity_; }
    [[nodiscard]] auto mode() const -> AccessMode override { return AccessMode::DIRECT; }
    [[nodiscard]] auto is_open() const -> bool override { return fd_.is_valid(); }

private:
    [[nodiscard]] auto query_size(int fd) const -> std::expected<uint64_t, util::Error>;
    [[nodiscard]] auto map_open_error(int err, const std::string& what) const -> util::Error;

    DeviceInfo device_;
    util::FileDescriptor fd_;
    uint64_t capacity_ = 0;
};

}  // namespace devices
