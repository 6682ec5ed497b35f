/**
 * @file InventoryLoader.hpp
 * @brief Authoritative device inventory from JSON
 */

#pragma once

#include "models/DeviceInfo.hpp"
#include "util/Error.hpp"

#include <expected>
#include <filesystem>
#include <string_view>
#include <vector>

namespace config {

/**
 * @brief Read a device inventory file
 *
 * The file holds a JSON array of objects with `id`, `path`,
 * `capacity_bytes` and `is_system_disk` (all required) plus optional
 * `sector_size`, `model`, `serial` and `is_removable`.
 *
 * @return ConfigurationError on malformed entries or duplicate ids
 */
[[nodiscard]] auto load_inventory(const std::filesystem::path& path)
    -> std::expected<std::vector<DeviceInfo>, util::Error>;

[[nodiscard]] auto parse_inventory(std::string_view text)
    -> std::expected<std::vector<DeviceInfo>, util::Error>;

}  // namespace config
