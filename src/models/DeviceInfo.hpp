/**
 * @file DeviceInfo.hpp
 * @brief Data model for a storage device selected for sanitization
 */

#pragma once

#include <cstdint>
#include <string>

/**
 * @struct DeviceInfo
 * @brief Identity and geometry of a storage device
 *
 * Supplied by the external hardware-detection layer. The system-disk flag is
 * authoritative: a device carrying it is never opened for writing.
 */
struct DeviceInfo {
    std::string id;                ///< Stable identifier used in requests and records
    std::string path;              ///< Block device or image path (e.g. /dev/sdb)
    uint64_t capacity_bytes = 0;   ///< Addressable capacity
    uint32_t sector_size = 512;    ///< Logical sector size in bytes
    std::string model;
    std::string serial;
    bool is_removable = false;
    bool is_system_disk = false;   ///< Boot or system disk (hard gate)

    auto operator==(const DeviceInfo&) const -> bool = default;
};
