/**
 * @file IDeviceAccessor.hpp
 * @brief Interface for the access paths a session can write a device through
 */

#pragma once

#include "models/DeviceInfo.hpp"
#include "models/WipeTypes.hpp"
#include "util/Error.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>

namespace devices {

/**
 * @struct AccessCapabilities
 * @brief What an access path can do on a given device
 */
struct AccessCapabilities {
    AccessMode mode = AccessMode::DIRECT;
    bool addressable = true;        ///< Offset-level write_chunk/read_chunk supported
    bool can_verify = true;         ///< Read-back supported
    uint64_t capacity_bytes = 0;
    std::string description;
};

/**
 * @class IDeviceAccessor
 * @brief Chunked, bounds-checked access to one device
 *
 * An accessor is owned by exactly one session. open() takes an exclusive
 * lock that close() (or destruction) releases.
 */
class IDeviceAccessor {
public:
    virtual ~IDeviceAccessor() = default;

    /**
     * @brief Probe whether this access path is usable for the device
     * @return Capabilities, or AccessDenied when the path cannot be used
     */
    [[nodiscard]] virtual auto detect_capability()
        -> std::expected<AccessCapabilities, util::Error> = 0;

    /**
     * @brief Acquire exclusive write access
     * @return AccessDenied on sharing violations or missing permissions
     */
    [[nodiscard]] virtual auto open() -> std::expected<void, util::Error> = 0;

    /**
     * @brief Write data at offset
     * @return OutOfRange if the range exceeds capacity, DeviceIOError on I/O failure,
     *         Unsupported for non-addressable paths
     */
    [[nodiscard]] virtual auto write_chunk(uint64_t offset, std::span<const uint8_t> data)
        -> std::expected<void, util::Error> = 0;

    /**
     * @brief Read out.size() bytes starting at offset into out
     */
    [[nodiscard]] virtual auto read_chunk(uint64_t offset, std::span<uint8_t> out)
        -> std::expected<void, util::Error> = 0;

    /**
     * @brief Zero the whole device in one operation
     */
    [[nodiscard]] virtual auto zero_fill_device(const std::atomic<bool>& cancel_flag)
        -> std::expected<void, util::Error> = 0;

    [[nodiscard]] virtual auto flush() -> std::expected<void, util::Error> = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual auto capacity() const -> uint64_t = 0;
    [[nodiscard]] virtual auto mode() const -> AccessMode = 0;
    [[nodiscard]] virtual auto is_open() const -> bool = 0;

    [[nodiscard]] virtual auto is_addressable() const -> bool {
        return mode() == AccessMode::DIRECT;
    }
};

/**
 * @class IAccessorFactory
 * @brief Creates the access paths for a device
 *
 * Each call returns a fresh accessor owned by the caller. create_fallback()
 * returns nullptr when no fallback path exists.
 */
class IAccessorFactory {
public:
    virtual ~IAccessorFactory() = default;

    [[nodiscard]] virtual auto create_raw(const DeviceInfo& device)
        -> std::unique_ptr<IDeviceAccessor> = 0;

    [[nodiscard]] virtual auto create_fallback(const DeviceInfo& device)
        -> std::unique_ptr<IDeviceAccessor> = 0;
};

/**
 * @brief Bounds check shared by the accessor implementations
 */
[[nodiscard]] inline auto check_range(uint64_t offset, uint64_t length, uint64_t capacity)
    -> std::expected<void, util::Error> {
    if (offset > capacity || length > capacity - offset) {
        return std::unexpected(util::Error::out_of_range(offset, length, capacity));
    }
    return {};
}

}  // namespace devices
