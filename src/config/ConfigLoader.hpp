/**
 * @file ConfigLoader.hpp
 * @brief Engine configuration from JSON
 */

#pragma once

#include "engine/WipeConfig.hpp"
#include "util/Error.hpp"

#include <expected>
#include <filesystem>
#include <string_view>

namespace config {

/**
 * @brief Read a WipeConfig from a JSON file
 *
 * Keys left out keep their defaults. Durations are given in milliseconds
 * (`retry_backoff_ms`, `max_backoff_ms`, `chunk_timeout_ms`,
 * `progress_interval_ms`).
 *
 * @return ConfigurationError if the file is unreadable, malformed or out of range
 */
[[nodiscard]] auto load_wipe_config(const std::filesystem::path& path)
    -> std::expected<engine::WipeConfig, util::Error>;

[[nodiscard]] auto parse_wipe_config(std::string_view text)
    -> std::expected<engine::WipeConfig, util::Error>;

/**
 * @brief Range checks shared by the loader and programmatic callers
 */
[[nodiscard]] auto validate_wipe_config(const engine::WipeConfig& config)
    -> std::expected<void, util::Error>;

}  // namespace config
